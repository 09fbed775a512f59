#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// JSON decoding
// ─────────────────────────────────────────────────────────────────────────────
// Incoming bodies and record-per-line streams are parsed with simdjson's
// on-demand API and materialized as nlohmann::json, which is the value type
// the rest of the library (endpoints, encoders, configuration) works with.

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace wcpp {

using Json = nlohmann::json;

struct JsonParseError {
    std::string message;
};

using JsonResult = tl::expected<Json, JsonParseError>;

struct JsonDecoderOptions {
    std::size_t max_depth{64};
    // A document followed by anything other than whitespace is rejected
    bool reject_trailing_content{true};
};

class JsonDecoder {
public:
    JsonDecoder() = default;
    explicit JsonDecoder(JsonDecoderOptions options) : options_(options) {}

    [[nodiscard]] JsonResult decode(std::string_view text);

    [[nodiscard]] const JsonDecoderOptions& options() const noexcept { return options_; }

private:
    simdjson::ondemand::parser parser_;
    JsonDecoderOptions options_;
};

/// Decodes with a thread-local JsonDecoder using default options.
[[nodiscard]] JsonResult decode_json(std::string_view text);

}  // namespace wcpp
