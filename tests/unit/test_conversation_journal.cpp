#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/tokens.hpp"
#include "core/errors/service_errors.hpp"
#include "session/conversation_journal.hpp"

namespace {

using turnstile::core::errors::get_error;
using turnstile::core::errors::get_value;
using turnstile::core::errors::is_error;
using turnstile::protocol::ConversationEntry;
using turnstile::protocol::TaskKey;
using turnstile::session::ConversationJournal;

std::vector<nlohmann::json> read_lines(const std::filesystem::path& path) {
    std::vector<nlohmann::json> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    return lines;
}

ConversationEntry user_message(const std::string& id, const std::string& text) {
    ConversationEntry entry;
    entry.entry_id = id;
    entry.created_at_unix_ms = 1700000000000;
    entry.body = turnstile::protocol::UserEvent{turnstile::protocol::UserMessage{text, {}}};
    return entry;
}

class ConversationJournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_dir_ = std::filesystem::temp_directory_path() /
                    ("turnstile_journal_" + turnstile::core::config::generate_token("", 12));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(data_dir_, ec);
    }

    std::filesystem::path data_dir_;
};

TEST_F(ConversationJournalTest, AppendsOneLinePerEntry) {
    ConversationJournal journal(data_dir_);
    const TaskKey key{2, 7};

    auto first = journal.write_entry(key, user_message("e1", "hello"));
    ASSERT_FALSE(is_error(first));
    auto second = journal.write_entry(key, user_message("e2", "again"));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(first), get_value(second));
    EXPECT_EQ(get_value(first).filename().string(), "w2_t7.jsonl");

    const auto lines = read_lines(get_value(first));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["event"], "entry");
    EXPECT_EQ(lines[0]["task"], "w2/t7");
    EXPECT_EQ(lines[0]["payload"]["entry_id"], "e1");
    EXPECT_EQ(lines[1]["payload"]["entry_id"], "e2");
    EXPECT_EQ(lines[1]["payload"]["type"], "user_event");
}

TEST_F(ConversationJournalTest, SeparateFilePerTask) {
    ConversationJournal journal(data_dir_);
    auto a = journal.write_entry(TaskKey{1, 1}, user_message("e1", "a"));
    auto b = journal.write_entry(TaskKey{1, 2}, user_message("e1", "b"));
    ASSERT_FALSE(is_error(a));
    ASSERT_FALSE(is_error(b));
    EXPECT_NE(get_value(a), get_value(b));
    EXPECT_EQ(read_lines(get_value(a)).size(), 1u);
    EXPECT_EQ(read_lines(get_value(b)).size(), 1u);
}

TEST_F(ConversationJournalTest, RejectsZeroKey) {
    ConversationJournal journal(data_dir_);
    auto result = journal.journal_path(TaskKey{0, 1});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_task_key");
}

TEST_F(ConversationJournalTest, DataDirThatIsAFileIsRejected) {
    std::filesystem::create_directories(data_dir_);
    const auto file_path = data_dir_ / "not_a_dir";
    {
        std::ofstream out(file_path);
        out << "x";
    }
    ConversationJournal journal(file_path);
    auto result = journal.write_entry(TaskKey{1, 1}, user_message("e1", "x"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_data_dir");
}

}  // namespace
