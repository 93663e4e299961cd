#include "cache/cache_meta.h"
#include "utilities/errors.h"

#include <chrono>
#include <json/json.h>
#include <memory>

namespace gutex {

std::int64_t nowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static Json::Value optionalString(const std::optional<std::string> &value) {
  return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

std::string CacheMeta::toJson() const {
  Json::Value root;
  root["resourceId"] = resourceId;
  root["fileSize"] = static_cast<Json::Int64>(fileSize);
  root["etag"] = optionalString(etag);
  root["lastModified"] = optionalString(lastModified);
  root["blockSize"] = static_cast<Json::Int64>(blockSize);
  root["lastValidatedTs"] = static_cast<Json::Int64>(lastValidatedTs);
  root["lastAccessedTs"] = static_cast<Json::Int64>(lastAccessedTs);
  root["createdTs"] = static_cast<Json::Int64>(createdTs);
  root["blocksCached"] = static_cast<Json::Int64>(blocksCached);
  root["totalBlocks"] = static_cast<Json::Int64>(totalBlocks);

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, root);
}

CacheMeta CacheMeta::fromJson(const std::string &text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
    throw CacheIoError("Malformed cache metadata: " + errors);
  if (!root.isObject() || !root["fileSize"].isIntegral() ||
      !root["blockSize"].isIntegral())
    throw CacheIoError("Cache metadata lacks fileSize/blockSize");

  CacheMeta meta;
  meta.resourceId = root.get("resourceId", "").asString();
  meta.fileSize = root["fileSize"].asInt64();
  meta.blockSize = root["blockSize"].asInt64();
  if (root["etag"].isString())
    meta.etag = root["etag"].asString();
  if (root["lastModified"].isString())
    meta.lastModified = root["lastModified"].asString();
  meta.lastValidatedTs = root.get("lastValidatedTs", 0).asInt64();
  meta.lastAccessedTs = root.get("lastAccessedTs", 0).asInt64();
  meta.createdTs = root.get("createdTs", 0).asInt64();
  meta.blocksCached = root.get("blocksCached", 0).asInt64();
  meta.totalBlocks = root.get("totalBlocks", 0).asInt64();
  if (meta.fileSize < 0 || meta.blockSize <= 0)
    throw CacheIoError("Cache metadata has invalid sizes");
  return meta;
}

} // namespace gutex
