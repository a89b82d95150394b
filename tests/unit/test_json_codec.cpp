#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/json_codec.hpp"

namespace {

using nlohmann::json;
using turnstile::core::errors::get_error;
using turnstile::core::errors::get_value;
using turnstile::core::errors::is_error;
namespace codec = turnstile::protocol::codec;
namespace protocol = turnstile::protocol;

TEST(JsonCodecTest, DecodesHelloWithAndWithoutLastSeenRev) {
    auto first = codec::decode_client_message(R"({"type":"hello","protocol_version":1})");
    ASSERT_FALSE(is_error(first));
    const auto& hello = std::get<protocol::ClientHello>(get_value(first));
    EXPECT_EQ(hello.protocol_version, 1u);
    EXPECT_FALSE(hello.last_seen_rev.has_value());

    auto second = codec::decode_client_message(
        R"({"type":"hello","protocol_version":1,"last_seen_rev":17})");
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(std::get<protocol::ClientHello>(get_value(second)).last_seen_rev.value(), 17u);
}

TEST(JsonCodecTest, RejectsMalformedAndUnknownMessages) {
    auto garbage = codec::decode_client_message("{not json");
    ASSERT_TRUE(is_error(garbage));
    EXPECT_EQ(get_error(garbage).code, "malformed_message");

    auto no_type = codec::decode_client_message(R"({"protocol_version":1})");
    ASSERT_TRUE(is_error(no_type));
    EXPECT_EQ(get_error(no_type).code, "malformed_message");

    auto unknown = codec::decode_client_message(R"({"type":"subscribe"})");
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_message_type");

    auto negative = codec::decode_client_message(R"({"type":"hello","protocol_version":-1})");
    ASSERT_TRUE(is_error(negative));
}

TEST(JsonCodecTest, ActionMessageKeepsRawActionBody) {
    auto decoded = codec::decode_client_message(
        R"({"type":"action","request_id":"r1","action":{"type":"nope"}})");
    ASSERT_FALSE(is_error(decoded));
    const auto& message = std::get<protocol::ClientActionMessage>(get_value(decoded));
    EXPECT_EQ(message.request_id, "r1");

    auto action = codec::decode_action(message.action);
    ASSERT_TRUE(is_error(action));
    EXPECT_EQ(get_error(action).code, "unknown_action");
}

TEST(JsonCodecTest, DecodesSendMessageWithAttachments) {
    const json body = {
        {"type", "send_agent_message"},
        {"workdir_id", 1},
        {"task_id", 2},
        {"text", "look at this"},
        {"attachments",
         json::array({{{"id", "att_1"},
                       {"kind", "image"},
                       {"name", "shot.png"},
                       {"extension", "png"},
                       {"mime", "image/png"},
                       {"byte_len", 10}}})}};
    auto action = codec::decode_action(body);
    ASSERT_FALSE(is_error(action));
    const auto& send = std::get<protocol::SendAgentMessage>(get_value(action));
    EXPECT_EQ(send.key, (protocol::TaskKey{1, 2}));
    EXPECT_EQ(send.input.text, "look at this");
    ASSERT_EQ(send.input.attachments.size(), 1u);
    EXPECT_EQ(send.input.attachments[0].kind, protocol::AttachmentKind::Image);
    EXPECT_EQ(send.input.attachments[0].mime.value(), "image/png");
}

TEST(JsonCodecTest, AcceptsLegacyKeyAliases) {
    auto action = codec::decode_action(
        json{{"type", "cancel_agent_turn"}, {"workspace_id", 3}, {"thread_id", 9}});
    ASSERT_FALSE(is_error(action));
    EXPECT_EQ(std::get<protocol::CancelAgentTurn>(get_value(action)).key,
              (protocol::TaskKey{3, 9}));
}

TEST(JsonCodecTest, TaskStatusAcceptsLegacyNames) {
    auto action = codec::decode_action(json{{"type", "task_status_set"},
                                            {"workdir_id", 1},
                                            {"task_id", 1},
                                            {"task_status", "in_review"}});
    ASSERT_FALSE(is_error(action));
    EXPECT_EQ(std::get<protocol::TaskStatusSet>(get_value(action)).status,
              protocol::TaskStatus::Validating);
}

TEST(JsonCodecTest, MissingOrMistypedFieldsAreInvalidActions) {
    auto missing = codec::decode_action(json{{"type", "task_star_set"}, {"workdir_id", 1}});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_action");

    auto mistyped = codec::decode_action(json{{"type", "task_star_set"},
                                              {"workdir_id", 1},
                                              {"task_id", 1},
                                              {"starred", "yes"}});
    ASSERT_TRUE(is_error(mistyped));
    EXPECT_EQ(get_error(mistyped).code, "invalid_action");

    auto not_object = codec::decode_action(json::array());
    ASSERT_TRUE(is_error(not_object));
}

TEST(JsonCodecTest, TerminalCommandReconnectIsOptional) {
    auto action = codec::decode_action(json{{"type", "terminal_command_start"},
                                            {"workdir_id", 1},
                                            {"task_id", 1},
                                            {"command", "ls"}});
    ASSERT_FALSE(is_error(action));
    const auto& start = std::get<protocol::TerminalCommandStart>(get_value(action));
    EXPECT_EQ(start.command, "ls");
    EXPECT_FALSE(start.reconnect.has_value());
}

TEST(JsonCodecTest, EncodesServerMessages) {
    EXPECT_EQ(json::parse(codec::encode(protocol::PongMessage{})), json({{"type", "pong"}}));

    const auto ack = json::parse(codec::encode(protocol::AckMessage{"r7", 12}));
    EXPECT_EQ(ack["type"], "ack");
    EXPECT_EQ(ack["request_id"], "r7");
    EXPECT_EQ(ack["rev"], 12);

    const auto error = json::parse(
        codec::encode(protocol::ErrorMessage{std::nullopt, "bad", "malformed_message"}));
    EXPECT_TRUE(error["request_id"].is_null());
    EXPECT_EQ(error["code"], "malformed_message");

    const auto event = json::parse(codec::encode(
        protocol::EventMessage{4, protocol::ToastEvent{"Turn failed: boom"}}));
    EXPECT_EQ(event["type"], "event");
    EXPECT_EQ(event["rev"], 4);
    EXPECT_EQ(event["event"]["type"], "toast");
    EXPECT_EQ(event["event"]["message"], "Turn failed: boom");
}

TEST(JsonCodecTest, EncodesConversationEntriesByTag) {
    protocol::ConversationEntry entry;
    entry.entry_id = "e_3";
    entry.created_at_unix_ms = 99;
    entry.body = protocol::AgentEvent{protocol::AgentItem{
        "i1", protocol::AgentItemKind::FileChange, json{{"path", "a.cpp"}}}};

    const auto encoded = codec::to_json(entry);
    EXPECT_EQ(encoded["entry_id"], "e_3");
    EXPECT_EQ(encoded["type"], "agent_event");
    EXPECT_EQ(encoded["event"]["type"], "item");
    EXPECT_EQ(encoded["event"]["kind"], "file_change");
    EXPECT_EQ(encoded["event"]["payload"]["path"], "a.cpp");
}

TEST(JsonCodecTest, ConversationSnapshotMarksTruncation) {
    protocol::ConversationSnapshot snapshot;
    snapshot.entries_total = 10;
    snapshot.entries_start = 4;
    const auto encoded = codec::to_json(snapshot);
    EXPECT_TRUE(encoded["entries_truncated"].get<bool>());
    EXPECT_TRUE(encoded["latest_turn"].is_null());
    EXPECT_EQ(encoded["task_status"], "todo");
    EXPECT_EQ(encoded["run_status"], "idle");
}

}  // namespace
