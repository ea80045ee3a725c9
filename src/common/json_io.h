#pragma once

#include <filesystem>
#include <string>

#include <json/json.h>

namespace Shardrun {

/**
 * Replaces `path` with `content` so that readers only ever observe the old
 * file or the complete new one: write a sibling temp file, fsync, rename.
 * Throws PersistenceError on any failure.
 */
void WriteFileAtomically(const std::filesystem::path& path, const std::string& content);

/**
 * Serializes a JSON value. indent == "" yields a single line (JSONL records).
 */
std::string ToJsonString(const Json::Value& value, const std::string& indent = "");

/**
 * Parses a JSON document. Returns false and fills `error` on malformed input.
 */
bool ParseJson(const std::string& text, Json::Value& out, std::string* error = nullptr);

/**
 * Reads and parses a JSON file. Throws std::runtime_error if unreadable or malformed.
 */
Json::Value ReadJsonFile(const std::filesystem::path& path);

} // namespace Shardrun
