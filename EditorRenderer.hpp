// EditorRenderer.hpp
#pragma once

#include "imgui.h"
#include "EditAction.hpp"

class Application;
class Document;
class IconManager;

// Draws the document and turns mouse and keyboard input into edit messages.
class EditorRenderer
{
public:
    EditorRenderer(Application* app, IconManager* icons);
    ~EditorRenderer() = default;

    void renderMenuBar();
    void renderEditor();

private:
    Application* app_;
    IconManager* icons_;

    float scrollX_;
    float scrollY_;
    float maxContentWidth_;
    float lineHeight_;
    bool caretFollow_;
    bool isDragging_;
    int dragIndex_;

    bool vDragging_;
    float vDragMouseStart_;
    float vDragScrollStart_;

    void edit(const EditAction& action);

    void renderToolbar();
    void renderStatusBar(float width);
    void renderGutter(ImDrawList* drawList, const Document& doc, ImVec2 pos, float gutterWidth,
                      float viewH, float cellWidth, float padY,
                      int firstVisibleLine, int lastVisibleLine);
    void renderSelection(ImDrawList* drawList, const Document& doc, ImVec2 pos, float cellWidth,
                         float padX, float padY, int firstVisibleLine, int lastVisibleLine);
    void renderVisibleLines(ImDrawList* drawList, const Document& doc, ImVec2 pos,
                            float padX, float padY, int firstVisibleLine, int lastVisibleLine);
    void renderCaret(ImDrawList* drawList, const Document& doc, ImVec2 pos, float padX, float padY,
                     bool isFocused);
    void renderVerticalScrollbar(ImVec2 pos, float viewW, float viewH, float scrollbarW,
                                 float totalContentHeight);

    int indexAt(const Document& doc, ImVec2 screenPos, ImVec2 pos, float padX, float padY) const;
    void handleMouseInput(ImVec2 pos, float padX, float padY);
    void handleKeyboardInput();
    void followCaret(float padX, float viewW, float viewH, float cellWidth);
};
