/**
 * @file response_envelope.cpp
 * @brief jsoncpp-backed envelope encoding.
 */
#include "meshnode/routing/response_envelope.hpp"
#include "meshnode/config/constants.hpp"

#include <memory>
#include <sstream>

#include <boost/beast/http/status.hpp>
#include <json/json.h>

namespace meshnode::routing {

    namespace http = boost::beast::http;

    namespace {
    // Compact single-line writer; output is newline terminated like a streaming encoder.
    meshnode_detail::expected<std::string, std::string> write_compact(const Json::Value& v) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        builder["emitUTF8"]    = true;
        try {
            std::string out = Json::writeString(builder, v);
            out.push_back('\n');
            return out;
        } catch (const Json::Exception& e) {
            return meshnode_detail::unexpected(std::string(e.what()));
        }
    }
    } // namespace

    meshnode_detail::expected<std::string, std::string>
    encode_envelope(const ResponseEnvelope& env) {
        Json::Value root(Json::objectValue);
        root["status"]  = env.status;
        root["service"] = env.service;
        root["message"] = env.message;
        return write_compact(root);
    }

    meshnode_detail::expected<ResponseEnvelope, std::string>
    decode_envelope(std::string_view body) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string errs;
        if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
            return meshnode_detail::unexpected(errs);
        }
        if (!root.isObject() || !root["status"].isInt() || !root["service"].isString()) {
            return meshnode_detail::unexpected(std::string("not a response envelope"));
        }
        ResponseEnvelope env;
        env.status  = root["status"].asInt();
        env.service = root["service"].asString();
        env.message = root.get("message", "").asString();
        return env;
    }

    meshnode_detail::expected<std::string, std::string>
    encode_health(std::string_view service) {
        Json::Value root(Json::objectValue);
        root["status"]  = config::constants::HEALTH_STATUS;
        root["service"] = std::string(service);
        return write_compact(root);
    }

    std::string reason_phrase(int status) {
        // Registered codes Beast does not enumerate or words differently.
        switch (status) {
            case 413: return "Request Entity Too Large";
            case 414: return "Request URI Too Long";
            case 416: return "Requested Range Not Satisfiable";
            case 418: return "I'm a teapot";
            case 425: return "Too Early";
            // Vendor codes Beast enumerates but no registry lists.
            case 444:
            case 499:
            case 599: return "Unknown Error";
            default: break;
        }
        if (status < 100 || status > 999) return "Unknown Error";
        const auto s = http::int_to_status(static_cast<unsigned>(status));
        if (s == http::status::unknown) return "Unknown Error";
        return std::string(http::obsolete_reason(s));
    }

    std::string fault_message(int status) {
        std::ostringstream os;
        os << config::constants::MSG_FAULT_PREFIX << status << ' ' << reason_phrase(status);
        return os.str();
    }

} // namespace meshnode::routing
