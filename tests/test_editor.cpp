#include "Editor.hpp"
#include "FileDialogs.hpp"
#include "FileOperations.hpp"
#include "OutputLog.hpp"
#include "TaskRunner.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

// Answers dialogs from a script and counts how often each one was shown.
class ScriptedDialogs : public FileDialogs
{
public:
    Result<std::string> openAnswer = Error::dialogClosed();
    Result<std::string> saveAnswer = Error::dialogClosed();
    int openShown = 0;
    int saveShown = 0;

    Result<std::string> pickOpenPath(const std::string&) override
    {
        openShown++;
        return openAnswer;
    }
    Result<std::string> pickSavePath(const std::string&, const std::string& defaultName) override
    {
        assert(defaultName == "untitled.txt");
        saveShown++;
        return saveAnswer;
    }
};

struct Fixture
{
    ScriptedDialogs dialogs;
    FileOperations ops{&dialogs};
    OutputLog log;
    Editor editor{&ops, &log};
    fs::path dir;

    Fixture()
    {
        static int counter = 0;
        dir = fs::temp_directory_path() / ("jotter_test_editor_" + std::to_string(counter++));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    ~Fixture() { fs::remove_all(dir); }

    // Feeds a message in and runs the task it schedules to completion, the
    // way the UI loop would over several frames.
    void send(Message message)
    {
        std::optional<Task> task = editor.update(std::move(message));
        while (task)
        {
            TaskRunner runner;
            runner.spawn(std::move(*task));
            task.reset();
            for (auto& done : runner.drain())
                task = editor.update(std::move(done));
        }
    }

    std::string file(const std::string& name, const std::string& content)
    {
        std::string path = (dir / name).string();
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    static std::string read(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

static void new_clears_path_and_content()
{
    Fixture f;
    f.dialogs.openAnswer = f.file("a.txt", "some text");
    f.send(msg::Open{});
    assert(f.editor.path());
    f.send(msg::New{});
    assert(!f.editor.path());
    assert(f.editor.document().empty());
    assert(f.editor.statusText() == "New file");
    assert(f.editor.title() == "Jotter");
}

static void open_round_trips_bytes()
{
    Fixture f;
    const std::string content = "alpha\r\n\tbeta\n\xCE\xBB\n";
    std::string path = f.file("b.txt", content);
    f.dialogs.openAnswer = path;
    f.send(msg::Open{});
    assert(f.dialogs.openShown == 1);
    assert(*f.editor.path() == path);
    assert(f.editor.document().text() == content);
    assert(f.editor.title() == "Jotter - b.txt");
    assert(!f.editor.busy());
    assert(f.log.lines().back().icon == OutputIcon::Folder);
}

static void save_without_path_asks_for_one()
{
    Fixture f;
    std::string target = (f.dir / "new.txt").string();
    f.dialogs.saveAnswer = target;
    f.send(msg::Edit{EditAction::insert("fresh")});
    f.send(msg::Save{});
    assert(f.dialogs.saveShown == 1);
    assert(*f.editor.path() == target);
    assert(Fixture::read(target) == "fresh");
    assert(f.log.lines().back().text == "Saved: " + target);
}

static void save_with_path_writes_directly()
{
    Fixture f;
    std::string path = f.file("c.txt", "old");
    std::optional<Task> load = f.editor.openPath(path);
    assert(load);
    f.send((*load)());
    assert(*f.editor.path() == path);
    f.send(msg::Edit{EditAction::move(Motion::DocumentEnd)});
    f.send(msg::Edit{EditAction::insert(" and new")});
    f.send(msg::Save{});
    assert(f.dialogs.saveShown == 0);
    assert(Fixture::read(path) == "old and new");
}

static void cancelled_dialogs_only_set_error()
{
    Fixture f;
    std::string path = f.file("d.txt", "keep me");
    f.dialogs.openAnswer = path;
    f.send(msg::Open{});

    f.dialogs.openAnswer = Error::dialogClosed();
    f.send(msg::Open{});
    assert(*f.editor.path() == path);
    assert(f.editor.document().text() == "keep me");
    assert(f.editor.error() && f.editor.error()->kind == Error::Kind::DialogClosed);

    Fixture g;
    g.send(msg::Edit{EditAction::insert("draft")});
    g.send(msg::Save{});
    assert(g.dialogs.saveShown == 1);
    assert(!g.editor.path());
    assert(g.editor.document().text() == "draft");
    assert(g.editor.error() && g.editor.error()->kind == Error::Kind::DialogClosed);
    assert(g.editor.statusText() == "Dialog closed");

    // the next edit clears it again
    g.send(msg::Edit{EditAction::move(Motion::Left)});
    assert(!g.editor.error());
}

static void io_failures_are_reported()
{
    Fixture f;
    f.dialogs.openAnswer = (f.dir / "missing.txt").string();
    f.send(msg::Open{});
    assert(!f.editor.path());
    assert(f.editor.error()->kind == Error::Kind::IOFailed);
    assert(f.editor.error()->code == std::errc::no_such_file_or_directory);
    assert(f.editor.statusText().rfind("I/O error", 0) == 0);
    assert(f.log.lines().back().icon == OutputIcon::Error);

    f.dialogs.saveAnswer = (f.dir / "no" / "such" / "dir.txt").string();
    f.send(msg::Save{});
    assert(!f.editor.path());
    assert(f.editor.error()->kind == Error::Kind::IOFailed);
}

static void one_operation_at_a_time()
{
    Fixture f;
    std::optional<Task> first = f.editor.update(msg::Open{});
    assert(first);
    assert(f.editor.busy());
    assert(!f.editor.update(msg::Save{}));
    assert(!f.editor.update(msg::Open{}));
    assert(f.log.lines().back().icon == OutputIcon::Error);

    // completion frees the slot
    f.editor.update((*first)());
    assert(!f.editor.busy());
    assert(f.editor.update(msg::Save{}));
}

static void new_during_save_keeps_the_blank_buffer_unnamed()
{
    Fixture f;
    std::string target = (f.dir / "draft.txt").string();
    f.dialogs.saveAnswer = target;
    f.send(msg::Edit{EditAction::insert("draft")});

    std::optional<Task> save = f.editor.update(msg::Save{});
    assert(save);
    f.editor.update(msg::New{});
    assert(f.editor.document().empty());
    assert(!f.editor.path());

    f.editor.update((*save)());
    assert(!f.editor.busy());
    assert(!f.editor.path());
    assert(f.log.lines().back().text == "Saved: " + target);
    assert(Fixture::read(target) == "draft");

    // saving the blank buffer asks for a name instead of overwriting the draft
    f.dialogs.saveAnswer = Error::dialogClosed();
    f.send(msg::Save{});
    assert(f.dialogs.saveShown == 2);
    assert(Fixture::read(target) == "draft");

    // a later save is adopted normally
    f.dialogs.saveAnswer = (f.dir / "second.txt").string();
    f.send(msg::Save{});
    assert(*f.editor.path() == (f.dir / "second.txt").string());
}

static void cursor_position_text()
{
    Fixture f;
    assert(f.editor.positionText() == "1:1");
    f.send(msg::Edit{EditAction::insert("ab")});
    f.send(msg::Edit{EditAction::enter()});
    f.send(msg::Edit{EditAction::insert("c")});
    assert(f.editor.positionText() == "2:2");

    // columns count characters
    f.send(msg::Edit{EditAction::insert("\xC3\xA9\xE2\x82\xAC")});
    assert(f.editor.positionText() == "2:4");
}

int main()
{
    new_clears_path_and_content();
    open_round_trips_bytes();
    save_without_path_asks_for_one();
    save_with_path_writes_directly();
    cancelled_dialogs_only_set_error();
    io_failures_are_reported();
    one_operation_at_a_time();
    new_during_save_keeps_the_blank_buffer_unnamed();
    cursor_position_text();
    return 0;
}
