#include "wcpp/json/json_decoder.hpp"

#include <format>

namespace wcpp {

namespace {

using simdjson::ondemand::json_type;

JsonParseError simd_error(simdjson::error_code code) {
    return JsonParseError{std::string(simdjson::error_message(code))};
}

JsonResult to_json(simdjson::ondemand::value value, std::size_t depth, std::size_t max_depth);

JsonResult object_to_json(simdjson::ondemand::object object, std::size_t depth, std::size_t max_depth) {
    Json out = Json::object();
    for (auto field : object) {
        std::string_view key;
        if (auto err = field.unescaped_key().get(key); err) {
            return tl::unexpected(simd_error(err));
        }
        std::string owned_key(key);

        simdjson::ondemand::value member;
        if (auto err = field.value().get(member); err) {
            return tl::unexpected(simd_error(err));
        }
        auto converted = to_json(member, depth + 1, max_depth);
        if (!converted) {
            return converted;
        }
        out[std::move(owned_key)] = std::move(*converted);
    }
    return out;
}

JsonResult array_to_json(simdjson::ondemand::array array, std::size_t depth, std::size_t max_depth) {
    Json out = Json::array();
    for (auto element : array) {
        simdjson::ondemand::value item;
        if (auto err = element.get(item); err) {
            return tl::unexpected(simd_error(err));
        }
        auto converted = to_json(item, depth + 1, max_depth);
        if (!converted) {
            return converted;
        }
        out.push_back(std::move(*converted));
    }
    return out;
}

template <typename Node>
JsonResult number_to_json(Node& value) {
    simdjson::ondemand::number_type kind;
    if (auto err = value.get_number_type().get(kind); err) {
        return tl::unexpected(simd_error(err));
    }
    switch (kind) {
        case simdjson::ondemand::number_type::signed_integer: {
            std::int64_t n = 0;
            if (auto err = value.get_int64().get(n); err) return tl::unexpected(simd_error(err));
            return Json(n);
        }
        case simdjson::ondemand::number_type::unsigned_integer: {
            std::uint64_t n = 0;
            if (auto err = value.get_uint64().get(n); err) return tl::unexpected(simd_error(err));
            return Json(n);
        }
        default: {
            double d = 0.0;
            if (auto err = value.get_double().get(d); err) return tl::unexpected(simd_error(err));
            return Json(d);
        }
    }
}

// Node is either an ondemand::value or the ondemand::document itself; scalar
// documents cannot be turned into a value, so the root is walked directly.
template <typename Node>
JsonResult node_to_json(Node& value, std::size_t depth, std::size_t max_depth) {
    if (depth > max_depth) {
        return tl::unexpected(JsonParseError{
            std::format("nesting deeper than {} levels", max_depth)});
    }

    json_type type;
    if (auto err = value.type().get(type); err) {
        return tl::unexpected(simd_error(err));
    }

    switch (type) {
        case json_type::object: {
            simdjson::ondemand::object object;
            if (auto err = value.get_object().get(object); err) return tl::unexpected(simd_error(err));
            return object_to_json(object, depth, max_depth);
        }
        case json_type::array: {
            simdjson::ondemand::array array;
            if (auto err = value.get_array().get(array); err) return tl::unexpected(simd_error(err));
            return array_to_json(array, depth, max_depth);
        }
        case json_type::string: {
            std::string_view s;
            if (auto err = value.get_string().get(s); err) return tl::unexpected(simd_error(err));
            return Json(std::string(s));
        }
        case json_type::number:
            return number_to_json(value);
        case json_type::boolean: {
            bool b = false;
            if (auto err = value.get_bool().get(b); err) return tl::unexpected(simd_error(err));
            return Json(b);
        }
        case json_type::null:
            return Json(nullptr);
        default:
            break;
    }
    return tl::unexpected(JsonParseError{"unrecognized JSON value"});
}

JsonResult to_json(simdjson::ondemand::value value, std::size_t depth, std::size_t max_depth) {
    return node_to_json(value, depth, max_depth);
}

}  // namespace

JsonResult JsonDecoder::decode(std::string_view text) {
    simdjson::padded_string padded(text);

    simdjson::ondemand::document doc;
    if (auto err = parser_.iterate(padded).get(doc); err) {
        return tl::unexpected(simd_error(err));
    }

    try {
        auto converted = node_to_json(doc, 0, options_.max_depth);
        if (!converted) {
            return converted;
        }
        if (options_.reject_trailing_content && doc.at_end() == false) {
            return tl::unexpected(JsonParseError{"trailing content after JSON document"});
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError{e.what()});
    }
}

JsonResult decode_json(std::string_view text) {
    thread_local JsonDecoder decoder;
    return decoder.decode(text);
}

}  // namespace wcpp
