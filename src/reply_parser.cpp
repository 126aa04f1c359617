#include "reply_parser.hpp"
#include <cctype>

namespace vigil {

static std::optional<nlohmann::json> extract_between(const std::string& reply,
                                                     char open, char close) {
    auto first = reply.find(open);
    auto last = reply.rfind(close);
    if (first == std::string::npos || last == std::string::npos || last < first)
        return std::nullopt;

    auto j = nlohmann::json::parse(reply.substr(first, last - first + 1), nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    return j;
}

std::optional<nlohmann::json> extract_json_object(const std::string& reply) {
    auto j = extract_between(reply, '{', '}');
    if (!j || !j->is_object()) return std::nullopt;
    return j;
}

std::optional<nlohmann::json> extract_json_array(const std::string& reply) {
    auto j = extract_between(reply, '[', ']');
    if (!j || !j->is_array()) return std::nullopt;
    return j;
}

static ClassifierVerdict in_range(long long value, const char* how) {
    ClassifierVerdict v;
    if (value < 0 || value > 100) {
        v.status = VerdictStatus::Unparseable;
        v.reason = "score out of range";
        return v;
    }
    v.status = VerdictStatus::Ok;
    v.score = static_cast<int>(value);
    v.reason = how;
    return v;
}

ClassifierVerdict parse_sensitivity_score(const std::string& reply) {
    if (auto obj = extract_json_object(reply)) {
        auto it = obj->find("sensitivity_score");
        if (it != obj->end() && it->is_number_integer())
            return in_range(it->get<long long>(), "json");
        if (it != obj->end() && it->is_number_float()) {
            double d = it->get<double>();
            if (d >= 0.0 && d <= 100.0) return in_range(static_cast<long long>(d), "json");
        }
    }

    size_t i = 0;
    while (i < reply.size() && !std::isdigit(static_cast<unsigned char>(reply[i]))) ++i;
    if (i == reply.size()) {
        ClassifierVerdict v;
        v.status = VerdictStatus::Unparseable;
        v.reason = "no digits in reply";
        return v;
    }

    long long value = 0;
    size_t digits = 0;
    while (i < reply.size() && std::isdigit(static_cast<unsigned char>(reply[i]))) {
        if (++digits > 6) {
            ClassifierVerdict v;
            v.status = VerdictStatus::Unparseable;
            v.reason = "score out of range";
            return v;
        }
        value = value * 10 + (reply[i] - '0');
        ++i;
    }
    return in_range(value, "digits");
}

} // namespace vigil
