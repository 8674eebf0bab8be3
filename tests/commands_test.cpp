//! # Command Handler Tests
//!
//! Runs `init`, `new`, `complete` and `list` against a storage root in a
//! temporary directory and checks both the printed messages and what ends
//! up on disk.

#include "cli/commands/cmd_complete.hpp"
#include "cli/commands/cmd_init.hpp"
#include "cli/commands/cmd_list.hpp"
#include "cli/commands/cmd_new.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace todo;
using namespace todo::cli;
namespace fs = std::filesystem;

namespace {

constexpr int64_t NEW_YEAR_2022 = 1640995200;

Timestamp at(int64_t seconds) {
    return Timestamp{std::chrono::seconds{seconds}};
}

ToDoItem make_item(int32_t id, std::string text, bool done = false) {
    ToDoItem item;
    item.id = id;
    item.text = std::move(text);
    item.created_date = at(NEW_YEAR_2022);
    if (done) {
        complete(item, at(NEW_YEAR_2022 + 90));
    }
    return item;
}

} // namespace

class CommandTest : public ::testing::Test {
protected:
    fs::path base;
    fs::path root;
    std::ostringstream out;

    void SetUp() override {
        base = fs::temp_directory_path() /
               ("todo_commands_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::error_code ec;
        fs::remove_all(base, ec);
        fs::create_directories(base);
        root = base / ".todo";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base, ec);
    }

    /// Creates the root and a list file holding `list`.
    Storage seed(const ToDoList& list) {
        fs::create_directories(root);
        Storage storage(root);
        EXPECT_TRUE(is_ok(storage.save(list)));
        return storage;
    }

    ToDoList stored() {
        Storage storage(root);
        auto result = storage.load();
        EXPECT_TRUE(is_ok(result));
        if (is_err(result) || !unwrap(result)) {
            return {};
        }
        return *unwrap(result);
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

// ============================================================================
// init
// ============================================================================

TEST_F(CommandTest, InitCreatesDirectoryAndPlaceholder) {
    Storage storage(root);
    EXPECT_EQ(handle_init(storage, out), exit_code::OK);

    EXPECT_EQ(out.str(),
              "path: " + root.string() + "\nSuccessfully initalised storage for todo\n");
    EXPECT_TRUE(fs::is_directory(root));
    EXPECT_TRUE(fs::exists(root / "todo.txt"));
    EXPECT_EQ(fs::file_size(root / "todo.txt"), 0u);
    EXPECT_FALSE(fs::exists(root / "todo.json"));
}

TEST_F(CommandTest, InitCreatesParentDirectories) {
    Storage storage(base / "a" / "b" / ".todo");
    EXPECT_EQ(handle_init(storage, out), exit_code::OK);
    EXPECT_TRUE(fs::exists(base / "a" / "b" / ".todo" / "todo.txt"));
}

TEST_F(CommandTest, InitInExistingDirectorySucceeds) {
    fs::create_directories(root);
    Storage storage(root);
    EXPECT_EQ(handle_init(storage, out), exit_code::OK);
    EXPECT_NE(out.str().find("Successfully initalised storage for todo"), std::string::npos);
}

TEST_F(CommandTest, InitTwiceFailsOnPlaceholder) {
    Storage storage(root);
    ASSERT_EQ(handle_init(storage, out), exit_code::OK);

    std::ostringstream second;
    EXPECT_EQ(handle_init(storage, second), exit_code::FAILURE);
    EXPECT_EQ(second.str(), "path: " + root.string() + "\nCouldn't create storage file " +
                                (root / "todo.txt").string() + ": File exists\n");
}

TEST_F(CommandTest, InitOverRegularFileFails) {
    {
        std::ofstream blocker(root);
    }
    Storage storage(root);
    EXPECT_EQ(handle_init(storage, out), exit_code::FAILURE);
    EXPECT_EQ(out.str().rfind("path: " + root.string() + "\n", 0), 0u);
    EXPECT_EQ(out.str().find("Successfully"), std::string::npos);
}

TEST_F(CommandTest, NewAfterInitStillCannotLoad) {
    Storage storage(root);
    ASSERT_EQ(handle_init(storage, out), exit_code::OK);

    std::ostringstream new_out;
    EXPECT_EQ(handle_new(storage, "Buy milk", new_out), exit_code::FAILURE);
    EXPECT_EQ(new_out.str(), "Couldn't load todo list from storage\n");
    EXPECT_FALSE(fs::exists(root / "todo.json"));
}

// ============================================================================
// new
// ============================================================================

TEST_F(CommandTest, NewAppendsOpenItem) {
    auto storage = seed({});
    auto before = now_seconds();

    EXPECT_EQ(handle_new(storage, "Walk the dog", out), exit_code::OK);
    EXPECT_EQ(out.str(), "New item (1) added to to todo list.\n");

    auto list = stored();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].id, 1);
    EXPECT_EQ(list[0].text, "Walk the dog");
    EXPECT_FALSE(list[0].done);
    EXPECT_FALSE(list[0].completed_date.has_value());
    EXPECT_GE(list[0].created_date, before);
    EXPECT_LE(list[0].created_date, now_seconds());
}

TEST_F(CommandTest, NewUsesMaxIdPlusOne) {
    auto storage = seed({make_item(1, "a"), make_item(7, "b", true), make_item(3, "c")});

    EXPECT_EQ(handle_new(storage, "d", out), exit_code::OK);
    EXPECT_EQ(out.str(), "New item (8) added to to todo list.\n");

    auto list = stored();
    ASSERT_EQ(list.size(), 4u);
    EXPECT_EQ(list.back().id, 8);
    EXPECT_EQ(list.back().text, "d");
}

TEST_F(CommandTest, NewKeepsTextVerbatim) {
    auto storage = seed({});
    const std::string text = "  \"quoted\" caf\xC3\xA9\n";
    EXPECT_EQ(handle_new(storage, text, out), exit_code::OK);
    EXPECT_EQ(stored().at(0).text, text);
}

TEST_F(CommandTest, NewFailsWhenIdsExhausted) {
    auto storage = seed({make_item(std::numeric_limits<int32_t>::max(), "last")});
    const std::string before = read_file(storage.list_path());

    EXPECT_EQ(handle_new(storage, "one more", out), exit_code::FAILURE);
    EXPECT_EQ(out.str(), "Error: no item id left to assign\n");
    EXPECT_EQ(read_file(storage.list_path()), before);
}

TEST_F(CommandTest, NewReportsFailedSave) {
    auto storage = seed({make_item(1, "a")});
    const std::string before = read_file(storage.list_path());
    fs::create_directory(root / "todo.json.tmp");

    EXPECT_EQ(handle_new(storage, "b", out), exit_code::FAILURE);
    EXPECT_EQ(out.str(), "Error: failed to write todo list to storage\n");
    EXPECT_EQ(read_file(storage.list_path()), before);
}

TEST_F(CommandTest, NewOnCorruptStorageLeavesFile) {
    fs::create_directories(root);
    Storage storage(root);
    {
        std::ofstream f(storage.list_path());
        f << "not json";
    }

    EXPECT_EQ(handle_new(storage, "x", out), exit_code::FAILURE);
    EXPECT_EQ(out.str().rfind("Error: todo list storage is corrupt: " +
                                  storage.list_path().string() + ": invalid JSON at line 1",
                              0),
              0u)
        << out.str();
    EXPECT_EQ(read_file(storage.list_path()), "not json");
}

TEST_F(CommandTest, NewOnUnreadableStorage) {
    fs::create_directories(root / "todo.json");
    Storage storage(root);

    EXPECT_EQ(handle_new(storage, "x", out), exit_code::FAILURE);
    EXPECT_EQ(out.str().rfind("Error: failed to read todo list from storage: ", 0), 0u);
}

// ============================================================================
// complete
// ============================================================================

TEST_F(CommandTest, CompleteMarksItemDone) {
    auto storage = seed({make_item(1, "Walk the dog"), make_item(2, "Buy milk")});
    auto before = now_seconds();

    EXPECT_EQ(handle_complete(storage, 1, out), exit_code::OK);
    EXPECT_EQ(out.str(), "Item 1 (Walk the dog) completed.\n");

    auto list = stored();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_TRUE(list[0].done);
    ASSERT_TRUE(list[0].completed_date.has_value());
    EXPECT_GE(*list[0].completed_date, before);
    EXPECT_EQ(list[0].created_date, at(NEW_YEAR_2022));
    EXPECT_EQ(list[1], make_item(2, "Buy milk"));
}

TEST_F(CommandTest, CompleteTwiceIsNotFound) {
    auto storage = seed({make_item(1, "a")});
    ASSERT_EQ(handle_complete(storage, 1, out), exit_code::OK);
    const std::string after_first = read_file(storage.list_path());

    std::ostringstream second;
    EXPECT_EQ(handle_complete(storage, 1, second), exit_code::FAILURE);
    EXPECT_EQ(second.str(), "Error: item 1 not found.\n");
    EXPECT_EQ(read_file(storage.list_path()), after_first);
}

TEST_F(CommandTest, CompleteUnknownIdIsNotFound) {
    auto storage = seed({make_item(1, "a")});
    EXPECT_EQ(handle_complete(storage, 42, out), exit_code::FAILURE);
    EXPECT_EQ(out.str(), "Error: item 42 not found.\n");
    EXPECT_FALSE(stored().at(0).done);
}

TEST_F(CommandTest, CompletePicksFirstOpenDuplicate) {
    auto storage = seed({make_item(2, "done already", true), make_item(2, "first open"),
                         make_item(2, "second open")});

    EXPECT_EQ(handle_complete(storage, 2, out), exit_code::OK);
    EXPECT_EQ(out.str(), "Item 2 (first open) completed.\n");

    auto list = stored();
    EXPECT_TRUE(list[1].done);
    EXPECT_FALSE(list[2].done);
}

TEST_F(CommandTest, CompleteUninitialized) {
    Storage storage(root);
    EXPECT_EQ(handle_complete(storage, 1, out), exit_code::FAILURE);
    EXPECT_EQ(out.str(), "Couldn't load todo list from storage\n");
}

// ============================================================================
// list
// ============================================================================

TEST_F(CommandTest, ListHidesDoneItems) {
    auto storage = seed({make_item(1, "a"), make_item(2, "b", true), make_item(3, "c")});

    EXPECT_EQ(handle_list(storage, ListOptions{}, out), exit_code::OK);
    EXPECT_EQ(out.str(), "TODO List\n\n     1. [ ] a \n     3. [ ] c \n");
}

TEST_F(CommandTest, ListAllIncludesDoneItems) {
    auto storage = seed({make_item(1, "a"), make_item(2, "b", true)});

    ListOptions opts;
    opts.all = true;
    EXPECT_EQ(handle_list(storage, opts, out), exit_code::OK);
    EXPECT_EQ(out.str(), "TODO List\n\n     1. [ ] a \n     2. [X] b \n");
}

TEST_F(CommandTest, ListEmpty) {
    auto storage = seed({});
    EXPECT_EQ(handle_list(storage, ListOptions{}, out), exit_code::OK);
    EXPECT_EQ(out.str(), "TODO List\n\n");
}

TEST_F(CommandTest, ListUninitialized) {
    Storage storage(root);
    EXPECT_EQ(handle_list(storage, ListOptions{}, out), exit_code::FAILURE);
    EXPECT_EQ(out.str(), "Couldn't load todo list from storage\n");
}

TEST_F(CommandTest, ListVerboseShowsLocalTimes) {
    std::optional<std::string> saved_tz;
    if (const char* tz = std::getenv("TZ")) {
        saved_tz = tz;
    }
    setenv("TZ", "UTC", 1);
    tzset();

    auto storage = seed({make_item(1, "a"), make_item(2, "b", true)});
    ListOptions opts;
    opts.all = true;
    opts.verbose = true;
    int code = handle_list(storage, opts, out);

    if (saved_tz) {
        setenv("TZ", saved_tz->c_str(), 1);
    } else {
        unsetenv("TZ");
    }
    tzset();

    EXPECT_EQ(code, exit_code::OK);
    EXPECT_EQ(out.str(), "TODO List\n\n"
                         "     1. [ ] a (created: 2022-01-01 00:00:00)\n"
                         "     2. [X] b (created: 2022-01-01 00:00:00 completed: 2022-01-01 "
                         "00:01:30)\n");
}

// ============================================================================
// Diagnostics
// ============================================================================

namespace {

class RecordingSink : public log::LogSink {
public:
    explicit RecordingSink(std::vector<log::LogLevel>& levels) : levels_(levels) {}

    void write(const log::LogRecord& record) override {
        levels_.push_back(record.level);
    }
    void flush() override {}

private:
    std::vector<log::LogLevel>& levels_;
};

} // namespace

class CommandLoggingTest : public CommandTest {
protected:
    std::vector<log::LogLevel> levels;

    void init_logger(log::LogLevel level) {
        log::LogConfig config;
        config.console = false;
        config.level = level;
        log::Logger::init(config);
        log::Logger::instance().add_sink(std::make_unique<RecordingSink>(levels));
    }

    void TearDown() override {
        log::Logger::instance().clear_sinks();
        CommandTest::TearDown();
    }
};

TEST_F(CommandLoggingTest, LogicalFailuresAreSilentAtDefaultLevel) {
    init_logger(log::LogLevel::Warn);

    Storage missing(root);
    EXPECT_EQ(handle_list(missing, ListOptions{}, out), exit_code::FAILURE);

    auto storage = seed({make_item(1, "a", true)});
    EXPECT_EQ(handle_complete(storage, 1, out), exit_code::FAILURE);

    EXPECT_TRUE(levels.empty());
}

TEST_F(CommandLoggingTest, LogicalFailuresLogAtInfo) {
    init_logger(log::LogLevel::Info);

    auto storage = seed({make_item(1, "a", true)});
    levels.clear();
    EXPECT_EQ(handle_complete(storage, 1, out), exit_code::FAILURE);

    ASSERT_EQ(levels.size(), 1u);
    EXPECT_EQ(levels[0], log::LogLevel::Info);
}

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(ParseListArgsTest, Flags) {
    auto check = [](std::vector<std::string> args, bool all, bool verbose) {
        auto result = parse_list_args(args);
        ASSERT_TRUE(is_ok(result));
        EXPECT_EQ(unwrap(result).all, all);
        EXPECT_EQ(unwrap(result).verbose, verbose);
    };

    check({}, false, false);
    check({"-a"}, true, false);
    check({"--all"}, true, false);
    check({"-v"}, false, true);
    check({"--verbose"}, false, true);
    check({"-av"}, true, true);
    check({"-va"}, true, true);
    check({"--all", "-v"}, true, true);
    check({"-a", "--"}, true, false);
    check({"--"}, false, false);
}

TEST(ParseListArgsTest, Rejects) {
    EXPECT_TRUE(is_err(parse_list_args({"-x"})));
    EXPECT_TRUE(is_err(parse_list_args({"-ax"})));
    EXPECT_TRUE(is_err(parse_list_args({"--everything"})));
    EXPECT_TRUE(is_err(parse_list_args({"extra"})));
    EXPECT_TRUE(unwrap(parse_list_args({"--help"})).help);
    EXPECT_EQ(unwrap_err(parse_list_args({"--", "-a"})), "unexpected argument '-a'");
}

TEST(ParseCompleteArgsTest, ParsesWholeInt32) {
    EXPECT_EQ(unwrap(parse_complete_args({"7"})).id, 7);
    EXPECT_EQ(unwrap(parse_complete_args({"-3"})).id, -3);
    EXPECT_EQ(unwrap(parse_complete_args({"2147483647"})).id, 2147483647);

    EXPECT_TRUE(is_err(parse_complete_args({})));
    EXPECT_TRUE(is_err(parse_complete_args({"1", "2"})));
    EXPECT_TRUE(is_err(parse_complete_args({"abc"})));
    EXPECT_TRUE(is_err(parse_complete_args({"12abc"})));
    EXPECT_TRUE(is_err(parse_complete_args({""})));
    EXPECT_TRUE(is_err(parse_complete_args({"2147483648"})));
    EXPECT_EQ(unwrap_err(parse_complete_args({"x1"})), "invalid id 'x1': expected a 32-bit integer");
}

TEST(ParseNewArgsTest, ExactlyOneText) {
    EXPECT_EQ(unwrap(parse_new_args({"Walk the dog"})).text, "Walk the dog");
    EXPECT_EQ(unwrap(parse_new_args({"--", "-5 push-ups"})).text, "-5 push-ups");
    EXPECT_EQ(unwrap(parse_new_args({""})).text, "");
    EXPECT_TRUE(unwrap(parse_new_args({"-h"})).help);

    EXPECT_EQ(unwrap_err(parse_new_args({})), "missing <todo text>");
    EXPECT_TRUE(is_err(parse_new_args({"Walk", "the dog"})));
    EXPECT_TRUE(is_err(parse_new_args({"--urgent", "x"})));
}
