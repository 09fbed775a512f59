#include "wcpp/http/body_encoder.hpp"

#include <ada.h>

namespace wcpp {

tl::expected<EncodedBody, std::string> JsonBodyEncoder::encode(const Json& body) const {
    try {
        return EncodedBody{body.dump(indent_), "application/json"};
    } catch (const Json::exception& e) {
        return tl::unexpected(std::string("cannot encode JSON body: ") + e.what());
    }
}

tl::expected<EncodedBody, std::string> FormBodyEncoder::encode(const Json& body) const {
    if (body.is_object() == false) {
        return tl::unexpected(std::string("form body must be a JSON object"));
    }

    ada::url_search_params params;
    for (const auto& item : body.items()) {
        const std::string& key = item.key();
        const Json& value = item.value();
        if (value.is_string()) {
            params.append(key, value.get<std::string>());
        } else if (value.is_primitive()) {
            params.append(key, value.dump());
        } else {
            return tl::unexpected("form field '" + key + "' is not a scalar");
        }
    }
    return EncodedBody{params.to_string(), "application/x-www-form-urlencoded"};
}

std::shared_ptr<const IBodyEncoder> default_body_encoder() {
    static const auto encoder = std::make_shared<const JsonBodyEncoder>();
    return encoder;
}

}  // namespace wcpp
