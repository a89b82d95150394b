#include "session/conversation_journal.hpp"

#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/tokens.hpp"
#include "protocol/json_codec.hpp"

namespace turnstile::session {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;

ConversationJournal::ConversationJournal(std::filesystem::path data_dir,
                                         std::filesystem::path journal_subdir)
    : data_dir_(std::move(data_dir)), journal_subdir_(std::move(journal_subdir)) {}

core::errors::Result<std::filesystem::path> ConversationJournal::journal_path(
    const protocol::TaskKey& key) const {
    if (key.workdir_id == 0 || key.task_id == 0) {
        return ServiceError{ErrorCategory::Input, "Task key must be non-zero.",
                            "invalid_task_key"};
    }

    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec || !std::filesystem::is_directory(data_dir_, ec)) {
        return ServiceError{ErrorCategory::Internal,
                            "Data directory is unusable: " + data_dir_.string(),
                            "invalid_data_dir"};
    }

    const auto journal_dir = data_dir_ / journal_subdir_;
    std::filesystem::create_directories(journal_dir, ec);
    if (ec) {
        return ServiceError{ErrorCategory::Internal,
                            "Unable to create journal directory: " + journal_dir.string(),
                            "journal_dir_create_failed"};
    }

    return journal_dir / ("w" + std::to_string(key.workdir_id) + "_t" +
                          std::to_string(key.task_id) + ".jsonl");
}

core::errors::Result<std::filesystem::path> ConversationJournal::append_line(
    const protocol::TaskKey& key, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = journal_path(key);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return ServiceError{ErrorCategory::Internal,
                            "Unable to open journal file: " + path.string(),
                            "journal_open_failed"};
    }
    out << line << "\n";
    if (!out.good()) {
        return ServiceError{ErrorCategory::Internal,
                            "Unable to write journal entry: " + path.string(),
                            "journal_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> ConversationJournal::write_entry(
    const protocol::TaskKey& key, const protocol::ConversationEntry& entry) {
    json line;
    line["ts_unix_ms"] = core::config::now_unix_ms();
    line["event"] = "entry";
    line["task"] = protocol::to_string(key);
    line["payload"] = protocol::codec::to_json(entry);
    return append_line(key, line.dump());
}

}  // namespace turnstile::session
