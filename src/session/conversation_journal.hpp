#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "core/errors/service_errors.hpp"
#include "protocol/conversation_contract.hpp"
#include "protocol/task_contract.hpp"

namespace turnstile::session {

// Append-only JSON-lines copy of every conversation entry, one file per task:
//   <data_dir>/conversations/w<workdir>_t<task>.jsonl
class ConversationJournal {
public:
    explicit ConversationJournal(std::filesystem::path data_dir,
                                 std::filesystem::path journal_subdir = "conversations");

    core::errors::Result<std::filesystem::path> write_entry(
        const protocol::TaskKey& key, const protocol::ConversationEntry& entry);

    core::errors::Result<std::filesystem::path> journal_path(
        const protocol::TaskKey& key) const;

private:
    core::errors::Result<std::filesystem::path> append_line(
        const protocol::TaskKey& key, const std::string& line);

    std::filesystem::path data_dir_;
    std::filesystem::path journal_subdir_;
    std::mutex mutex_;
};

}  // namespace turnstile::session
