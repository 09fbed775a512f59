#pragma once

#include "wcpp/json/json_decoder.hpp"

#include <tl/expected.hpp>

#include <memory>
#include <string>

namespace wcpp {

struct EncodedBody {
    std::string bytes;
    std::string content_type;
};

/// Serializes an endpoint's JSON body for the wire.
class IBodyEncoder {
public:
    virtual ~IBodyEncoder() = default;

    [[nodiscard]] virtual tl::expected<EncodedBody, std::string> encode(const Json& body) const = 0;
};

class JsonBodyEncoder final : public IBodyEncoder {
public:
    /// `indent` < 0 produces compact output.
    explicit JsonBodyEncoder(int indent = -1) : indent_(indent) {}

    [[nodiscard]] tl::expected<EncodedBody, std::string> encode(const Json& body) const override;

private:
    int indent_;
};

/// application/x-www-form-urlencoded from a flat JSON object.
class FormBodyEncoder final : public IBodyEncoder {
public:
    [[nodiscard]] tl::expected<EncodedBody, std::string> encode(const Json& body) const override;
};

[[nodiscard]] std::shared_ptr<const IBodyEncoder> default_body_encoder();

}  // namespace wcpp
