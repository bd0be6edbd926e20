// EditorRenderer.cpp
#include "EditorRenderer.hpp"
#include "Application.hpp"
#include "IconManager.hpp"
#include "TextLayout.hpp"
#include <cstdio>
#include <string>
#include <cstring>
#include <cmath>
#include <algorithm>

EditorRenderer::EditorRenderer(Application* app, IconManager* icons)
    : app_(app),
      icons_(icons),
      scrollX_(0.0f),
      scrollY_(0.0f),
      maxContentWidth_(0.0f),
      lineHeight_(0.0f),
      caretFollow_(true),
      isDragging_(false),
      dragIndex_(-1),
      vDragging_(false),
      vDragMouseStart_(0.0f),
      vDragScrollStart_(0.0f)
{
}

void EditorRenderer::edit(const EditAction& action)
{
    app_->dispatch(msg::Edit{action});
    caretFollow_ = true;
}

// ImGui hands out code points, the document stores UTF-8
static std::string encodeUtf8(unsigned int c)
{
    std::string out;
    if (c < 0x80)
    {
        out += (char)c;
    }
    else if (c < 0x800)
    {
        out += (char)(0xC0 | (c >> 6));
        out += (char)(0x80 | (c & 0x3F));
    }
    else if (c < 0x10000)
    {
        out += (char)(0xE0 | (c >> 12));
        out += (char)(0x80 | ((c >> 6) & 0x3F));
        out += (char)(0x80 | (c & 0x3F));
    }
    else if (c <= 0x10FFFF)
    {
        out += (char)(0xF0 | (c >> 18));
        out += (char)(0x80 | ((c >> 12) & 0x3F));
        out += (char)(0x80 | ((c >> 6) & 0x3F));
        out += (char)(0x80 | (c & 0x3F));
    }
    return out;
}

static float columnX(const std::string& line, int byteCol)
{
    return textColumnX(ImGui::GetFont(), ImGui::GetFontSize(), line, byteCol);
}

static int columnAtX(const std::string& line, float x)
{
    return textColumnAtX(ImGui::GetFont(), ImGui::GetFontSize(), line, x);
}

void EditorRenderer::renderMenuBar()
{
    if (ImGui::BeginMainMenuBar())
    {
        if (ImGui::BeginMenu("File"))
        {
            if (ImGui::MenuItem("New", "Ctrl+N"))
                app_->dispatch(msg::New{});
            if (ImGui::MenuItem("Open", "Ctrl+O", false, !app_->editor().busy()))
                app_->dispatch(msg::Open{});
            if (ImGui::MenuItem("Save", "Ctrl+S", false, !app_->editor().busy()))
                app_->dispatch(msg::Save{});
            ImGui::Separator();
            if (ImGui::MenuItem("Exit", "Alt+F4"))
            {
                app_->closeRequested = true;
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("View"))
        {
            ImGui::MenuItem("Output Panel", nullptr, &app_->showOutput);
            ImGui::MenuItem("Show Line Numbers", nullptr, &app_->showLineNumbers);
            ImGui::EndMenu();
        }
        ImGui::EndMainMenuBar();
    }
}

void EditorRenderer::renderToolbar()
{
    const ImVec2 buttonSize(130, 30);
    if (icons_->iconTextButton("##new_btn", OutputIcon::Document, "New file", buttonSize))
        app_->dispatch(msg::New{});
    ImGui::SameLine(0.0f, 15.0f);
    if (icons_->iconTextButton("##open_btn", OutputIcon::Folder, "Open a file", buttonSize))
        app_->dispatch(msg::Open{});
    ImGui::SameLine(0.0f, 15.0f);
    if (icons_->iconTextButton("##save_btn", OutputIcon::Save, "Save", buttonSize))
        app_->dispatch(msg::Save{});
}

void EditorRenderer::renderStatusBar(float width)
{
    const Editor& editor = app_->editor();

    if (editor.error())
        ImGui::TextColored(ImVec4(0.95f, 0.45f, 0.45f, 1.0f), "%s", editor.statusText().c_str());
    else
        ImGui::TextUnformatted(editor.statusText().c_str());

    std::string position = editor.positionText();
    float posWidth = ImGui::CalcTextSize(position.c_str()).x;
    ImGui::SameLine(std::max(0.0f, width - posWidth));
    ImGui::TextUnformatted(position.c_str());
}

// helper: compute gutter width
static float computeGutterWidth(int totalLines, float cellWidth)
{
    int lines = std::max(1, totalLines);
    int digits = 1;
    while (lines >= 10) { lines /= 10; digits++; }
    // Reserve at least 4 digits so the gutter doesn't jump while typing
    digits = std::max(digits, 4);

    // one character of padding on each side of the numbers
    return cellWidth + (digits * cellWidth) + cellWidth;
}

void EditorRenderer::renderGutter(ImDrawList* drawList, const Document& doc, ImVec2 pos,
                                  float gutterWidth, float viewH, float cellWidth, float padY,
                                  int firstVisibleLine, int lastVisibleLine)
{
    ImU32 gutterBg = ImGui::GetColorU32(ImGuiCol_ScrollbarBg);
    drawList->AddRectFilled(ImVec2(roundf(pos.x), roundf(pos.y)),
                            ImVec2(roundf(pos.x + gutterWidth), roundf(pos.y + viewH)),
                            gutterBg);

    int cursorLine = doc.cursorPosition().first;
    float innerRight = pos.x + gutterWidth - cellWidth;

    for (int line = firstVisibleLine; line < lastVisibleLine; ++line)
    {
        char buf[32];
        snprintf(buf, sizeof(buf), "%d", line + 1);
        float numWidth = ImGui::CalcTextSize(buf).x;

        float numX = roundf(innerRight - numWidth);
        float numY = roundf(pos.y + padY + line * lineHeight_ - scrollY_);

        ImGuiCol col = (line == cursorLine) ? ImGuiCol_Text : ImGuiCol_TextDisabled;
        drawList->AddText(ImVec2(numX, numY), ImGui::GetColorU32(col), buf);
    }
}

void EditorRenderer::renderSelection(ImDrawList* drawList, const Document& doc, ImVec2 pos,
                                     float cellWidth, float padX, float padY,
                                     int firstVisibleLine, int lastVisibleLine)
{
    if (!doc.hasSelection())
        return;

    auto range = doc.selectionRange();
    ImU32 selectionColor = IM_COL32(60, 120, 200, 100);

    int selMinLine, selMinCol, selMaxLine, selMaxCol;
    doc.indexToLineCol(range.first, selMinLine, selMinCol);
    doc.indexToLineCol(range.second, selMaxLine, selMaxCol);

    for (int line = std::max(selMinLine, firstVisibleLine);
         line <= selMaxLine && line < lastVisibleLine; line++)
    {
        const std::string& text = doc.lines()[line];
        float xStart = (line == selMinLine) ? columnX(text, selMinCol) : 0.0f;
        // the newline of a fully covered line shows as one extra cell
        float xEnd = (line == selMaxLine) ? columnX(text, selMaxCol)
                                          : columnX(text, (int)text.size()) + cellWidth;

        float lineY = pos.y + padY - scrollY_ + line * lineHeight_;
        float x1 = pos.x + padX - scrollX_ + xStart;
        float x2 = pos.x + padX - scrollX_ + xEnd;

        drawList->AddRectFilled(ImVec2(x1, lineY), ImVec2(x2, lineY + lineHeight_), selectionColor);
    }
}

void EditorRenderer::renderVisibleLines(ImDrawList* drawList, const Document& doc, ImVec2 pos,
                                        float padX, float padY,
                                        int firstVisibleLine, int lastVisibleLine)
{
    // horizontal scrolling is bounded by the widest line on screen
    maxContentWidth_ = 0.0f;
    float y = pos.y + padY - scrollY_ + firstVisibleLine * lineHeight_;
    for (int i = firstVisibleLine; i < lastVisibleLine; i++)
    {
        const std::string& text = doc.lines()[i];
        maxContentWidth_ = std::max(maxContentWidth_, columnX(text, (int)text.size()));
        ImVec2 textPos(roundf(pos.x + padX - scrollX_), roundf(y));
        drawList->AddText(textPos, ImGui::GetColorU32(ImGuiCol_Text),
                          text.data(), text.data() + text.size());
        y += lineHeight_;
    }
}

void EditorRenderer::renderCaret(ImDrawList* drawList, const Document& doc, ImVec2 pos,
                                 float padX, float padY, bool isFocused)
{
    if (!isFocused || (int)(ImGui::GetTime() * 2) % 2 != 0)
        return;

    auto [caretLine, caretCol] = doc.cursorPosition();

    float caretScreenX = pos.x + padX + columnX(doc.lines()[caretLine], caretCol) - scrollX_;
    float caretScreenY = pos.y + padY + caretLine * lineHeight_ - scrollY_;

    float caretTop = caretScreenY + lineHeight_ * 0.15f;
    float caretBottom = caretTop + lineHeight_ * 0.75f;
    drawList->AddLine(ImVec2(caretScreenX, caretTop),
                      ImVec2(caretScreenX, caretBottom),
                      ImGui::GetColorU32(ImGuiCol_Text), 2.0f);
}

int EditorRenderer::indexAt(const Document& doc, ImVec2 screenPos, ImVec2 pos, float padX,
                            float padY) const
{
    float localX = screenPos.x - pos.x - padX + scrollX_;
    float localY = screenPos.y - pos.y - padY + scrollY_;

    int line = (int)std::floor(localY / lineHeight_);
    line = std::clamp(line, 0, doc.lineCount() - 1);

    return doc.lineColToIndex(line, columnAtX(doc.lines()[line], localX));
}

void EditorRenderer::handleMouseInput(ImVec2 pos, float padX, float padY)
{
    ImGuiIO& io = ImGui::GetIO();

    if (ImGui::IsItemClicked())
    {
        const Document& doc = app_->editor().document();
        dragIndex_ = indexAt(doc, io.MousePos, pos, padX, padY);
        edit(EditAction::click(dragIndex_, io.KeyShift));
        isDragging_ = true;
    }

    if (isDragging_ && ImGui::IsMouseDown(ImGuiMouseButton_Left))
    {
        const Document& doc = app_->editor().document();
        int index = indexAt(doc, io.MousePos, pos, padX, padY);
        if (index != dragIndex_)
        {
            dragIndex_ = index;
            edit(EditAction::drag(index));
        }
    }

    if (isDragging_ && !ImGui::IsMouseDown(ImGuiMouseButton_Left))
    {
        isDragging_ = false;
        dragIndex_ = -1;
    }
}

void EditorRenderer::handleKeyboardInput()
{
    ImGuiIO& io = ImGui::GetIO();

    auto moveOrSelect = [&](Motion motion)
    {
        edit(io.KeyShift ? EditAction::select(motion) : EditAction::move(motion));
    };

    if (ImGui::IsKeyPressed(ImGuiKey_Enter) || ImGui::IsKeyPressed(ImGuiKey_KeypadEnter))
        edit(EditAction::enter());

    if (!io.KeyCtrl)
    {
        std::string typed;
        for (int i = 0; i < io.InputQueueCharacters.Size; i++)
        {
            unsigned int c = io.InputQueueCharacters[i];
            if (c == '\n' || c == '\r')
                continue;
            if (c >= 32 || c == '\t')
                typed += encodeUtf8(c);
        }
        if (!typed.empty())
            edit(EditAction::insert(typed));
    }

    if (ImGui::IsKeyPressed(ImGuiKey_Backspace))
        edit(EditAction::backspace());
    if (ImGui::IsKeyPressed(ImGuiKey_Delete))
        edit(EditAction::del());

    if (ImGui::IsKeyPressed(ImGuiKey_LeftArrow))
        moveOrSelect(Motion::Left);
    if (ImGui::IsKeyPressed(ImGuiKey_RightArrow))
        moveOrSelect(Motion::Right);
    if (ImGui::IsKeyPressed(ImGuiKey_UpArrow))
        moveOrSelect(Motion::Up);
    if (ImGui::IsKeyPressed(ImGuiKey_DownArrow))
        moveOrSelect(Motion::Down);
    if (ImGui::IsKeyPressed(ImGuiKey_Home))
        moveOrSelect(io.KeyCtrl ? Motion::DocumentStart : Motion::Home);
    if (ImGui::IsKeyPressed(ImGuiKey_End))
        moveOrSelect(io.KeyCtrl ? Motion::DocumentEnd : Motion::End);

    // Clipboard operations
    const Document& doc = app_->editor().document();
    if (io.KeyCtrl && (ImGui::IsKeyPressed(ImGuiKey_C) || ImGui::IsKeyPressed(ImGuiKey_X)) &&
        doc.hasSelection())
    {
        std::string text = doc.selectedText();
        ImGui::SetClipboardText(text.c_str());
        app_->addOutput(OutputIcon::Checkmark, "Copied " + std::to_string(text.size()) + " characters");
        if (ImGui::IsKeyPressed(ImGuiKey_X))
            edit(EditAction::backspace());
    }
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_V))
    {
        const char* clipText = ImGui::GetClipboardText();
        if (clipText && clipText[0])
            edit(EditAction::paste(clipText));
    }
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_A))
        edit(EditAction::selectAll());

    // Undo / Redo
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_Z))
        edit(EditAction::undo());
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_Y))
        edit(EditAction::redo());
}

void EditorRenderer::followCaret(float padX, float viewW, float viewH, float cellWidth)
{
    if (!caretFollow_)
        return;

    const Document& doc = app_->editor().document();
    auto [caretLine, caretCol] = doc.cursorPosition();

    float caretXLocal = columnX(doc.lines()[caretLine], caretCol);
    float caretYLocal = caretLine * lineHeight_;

    float visibleW = viewW - padX - cellWidth;
    float visibleH = viewH - lineHeight_ * 0.5f;

    if (caretXLocal < scrollX_)
        scrollX_ = caretXLocal;
    if (caretXLocal > scrollX_ + visibleW)
        scrollX_ = caretXLocal - visibleW;

    if (caretYLocal < scrollY_)
        scrollY_ = caretYLocal;
    if (caretYLocal + lineHeight_ > scrollY_ + visibleH)
        scrollY_ = caretYLocal + lineHeight_ - visibleH;

    caretFollow_ = false;
}

void EditorRenderer::renderVerticalScrollbar(ImVec2 pos, float viewW, float viewH, float scrollbarW,
                                             float totalContentHeight)
{
    ImVec2 vBarPos = ImVec2(pos.x + viewW, pos.y);

    ImU32 bgCol = ImGui::GetColorU32(ImGuiCol_FrameBgHovered);
    ImU32 fillCol = ImGui::GetColorU32(ImGuiCol_ScrollbarGrab);
    ImU32 fillHot = ImGui::GetColorU32(ImGuiCol_ScrollbarGrabHovered);
    ImU32 fillAct = ImGui::GetColorU32(ImGuiCol_ScrollbarGrabActive);

    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->AddRectFilled(vBarPos, ImVec2(vBarPos.x + scrollbarW, vBarPos.y + viewH), bgCol);

    float minThumb = 24.0f;
    float thumbH = (viewH / std::max(viewH, totalContentHeight)) * viewH;
    thumbH = std::clamp(thumbH, std::min(minThumb, viewH), viewH);

    float trackRange = std::max(1.0f, viewH - thumbH);
    float denom = std::max(1.0f, totalContentHeight - viewH);
    float thumbY = (scrollY_ / denom) * trackRange;

    ImVec2 thumbMin = ImVec2(vBarPos.x, vBarPos.y + thumbY);
    ImVec2 thumbMax = ImVec2(vBarPos.x + scrollbarW, vBarPos.y + thumbY + thumbH);

    ImGuiIO& io = ImGui::GetIO();

    ImGui::SetCursorScreenPos(thumbMin);
    ImGui::InvisibleButton("vthumb", ImVec2(scrollbarW, std::max(1.0f, thumbH)));
    bool thumbHovered = ImGui::IsItemHovered();

    if (ImGui::IsItemActivated())
    {
        vDragging_ = true;
        vDragMouseStart_ = io.MousePos.y;
        vDragScrollStart_ = scrollY_;
    }
    if (vDragging_)
    {
        if (ImGui::IsMouseDown(ImGuiMouseButton_Left))
        {
            float dy = io.MousePos.y - vDragMouseStart_;
            float newThumbY = std::clamp((vDragScrollStart_ / denom) * trackRange + dy, 0.0f, trackRange);
            scrollY_ = (newThumbY / trackRange) * denom;
        }
        else
        {
            vDragging_ = false;
        }
    }

    ImU32 thumbCol = vDragging_ ? fillAct : (thumbHovered ? fillHot : fillCol);
    dl->AddRectFilled(thumbMin, thumbMax, thumbCol, 3.0f);
}

void EditorRenderer::renderEditor()
{
    if (ImGui::Begin("Editor", nullptr,
                     ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                     ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoTitleBar |
                     ImGuiWindowFlags_NoBringToFrontOnFocus |
                     ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse))
    {
        renderToolbar();
        ImGui::Spacing();

        ImDrawList* drawList = ImGui::GetWindowDrawList();
        ImVec2 pos = ImGui::GetCursorScreenPos();

        // average glyph width, used for the gutter and padding
        lineHeight_ = ImGui::GetTextLineHeightWithSpacing();
        const char* sample = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
        float cellWidth = ImGui::CalcTextSize(sample).x / (float)strlen(sample);

        // Layout
        ImVec2 avail = ImGui::GetContentRegionAvail();
        const float statusH = ImGui::GetFrameHeightWithSpacing();
        const float padX = 4.0f;
        const float padY = 4.0f;
        const float scrollbarW = 12.0f;
        const float viewW = std::max(1.0f, avail.x - scrollbarW);
        const float viewH = std::max(lineHeight_, avail.y - statusH);

        // Clamp scrolls against the current document
        const Document& doc = app_->editor().document();
        float totalContentHeight = doc.lineCount() * lineHeight_ + padY * 2.0f;
        scrollY_ = std::clamp(scrollY_, 0.0f, std::max(0.0f, totalContentHeight - viewH));
        scrollX_ = std::clamp(scrollX_, 0.0f, std::max(0.0f, maxContentWidth_ + cellWidth - viewW / 2.0f));

        int firstVisibleLine = std::max(0, (int)std::floor(scrollY_ / lineHeight_));
        int lastVisibleLine = std::min(doc.lineCount(), firstVisibleLine + (int)std::ceil(viewH / lineHeight_) + 1);

        float gutterWidth = app_->showLineNumbers ? computeGutterWidth(doc.lineCount(), cellWidth) : 0.0f;
        float textPadX = gutterWidth + padX;

        drawList->AddRectFilled(pos, ImVec2(pos.x + viewW, pos.y + viewH),
                                ImGui::GetColorU32(ImGuiCol_FrameBg));

        // Editor interactive area
        ImGui::InvisibleButton("editor_area", ImVec2(viewW, viewH), ImGuiButtonFlags_MouseButtonLeft);
        bool isFocused = ImGui::IsItemFocused();
        bool isHovered = ImGui::IsItemHovered();
        if (isHovered)
        {
            ImGuiIO& io = ImGui::GetIO();
            ImGui::SetMouseCursor(ImGuiMouseCursor_TextInput);
            if (!io.KeyShift && io.MouseWheel != 0.0f)
                scrollY_ -= io.MouseWheel * lineHeight_ * 3.0f;
            if (io.KeyShift && io.MouseWheel != 0.0f)
                scrollX_ -= io.MouseWheel * 40.0f;
        }

        handleMouseInput(pos, textPadX, padY);
        if (isFocused)
            handleKeyboardInput();

        // input may have replaced the document
        const Document& current = app_->editor().document();
        lastVisibleLine = std::min(current.lineCount(), lastVisibleLine);
        followCaret(textPadX, viewW, viewH, cellWidth);

        drawList->PushClipRect(pos, ImVec2(pos.x + viewW, pos.y + viewH), true);
        drawList->PushClipRect(ImVec2(pos.x + gutterWidth, pos.y), ImVec2(pos.x + viewW, pos.y + viewH), true);
        renderSelection(drawList, current, pos, cellWidth, textPadX, padY, firstVisibleLine, lastVisibleLine);
        renderVisibleLines(drawList, current, pos, textPadX, padY, firstVisibleLine, lastVisibleLine);
        renderCaret(drawList, current, pos, textPadX, padY, isFocused);
        drawList->PopClipRect();
        if (app_->showLineNumbers)
            renderGutter(drawList, current, pos, gutterWidth, viewH, cellWidth, padY,
                         firstVisibleLine, lastVisibleLine);
        drawList->PopClipRect();

        renderVerticalScrollbar(pos, viewW, viewH, scrollbarW, totalContentHeight);

        ImGui::SetCursorScreenPos(ImVec2(pos.x, pos.y + viewH + ImGui::GetStyle().ItemSpacing.y));
        renderStatusBar(avail.x);
    }
    ImGui::End();
}
