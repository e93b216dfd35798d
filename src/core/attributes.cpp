#include "flowfile/core/attributes.hpp"
#include "flowfile/core/byte_order.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace flowfile {
namespace {

constexpr std::size_t kMaxField = std::numeric_limits<std::uint16_t>::max();

std::string base_name(const std::string& value) {
    const auto slash = value.find_last_of('/');
    return slash == std::string::npos ? value : value.substr(slash + 1);
}

Result<void> write_field(OutputSink& out, const std::string& field) {
    std::uint8_t len[2];
    store_be16(len, static_cast<std::uint16_t>(field.size()));
    if (auto res = out.write(len, sizeof(len)); res.is_error()) {
        return res;
    }
    return out.write(reinterpret_cast<const std::uint8_t*>(field.data()), field.size());
}

Result<std::string> read_field(InputStream& in, const char* what) {
    std::uint8_t len[2];
    auto got = read_full(in, len, sizeof(len));
    if (got.is_error()) {
        return Err<std::string>(ErrorCode::Malformed,
            std::string("Error reading ") + what + " size: " + got.error().message);
    }
    if (got.value() != sizeof(len)) {
        return Err<std::string>(ErrorCode::Malformed, std::string("Truncated ") + what + " size");
    }

    std::string field(load_be16(len), '\0');
    got = read_full(in, reinterpret_cast<std::uint8_t*>(field.data()), field.size());
    if (got.is_error()) {
        return Err<std::string>(ErrorCode::Malformed,
            std::string("Error reading ") + what + ": " + got.error().message);
    }
    if (got.value() != field.size()) {
        return Err<std::string>(ErrorCode::Malformed, std::string("Truncated ") + what);
    }
    return Ok(std::move(field));
}

} // namespace

AttributeSet::AttributeSet(std::initializer_list<Attribute> attrs) {
    for (const auto& a : attrs) {
        set(a.name, a.value);
    }
}

std::string AttributeSet::get(const std::string& name) const {
    for (const auto& a : attrs_) {
        if (a.name == name) {
            return a.value;
        }
    }
    return "";
}

bool AttributeSet::has(const std::string& name) const {
    return std::any_of(attrs_.begin(), attrs_.end(),
                       [&](const Attribute& a) { return a.name == name; });
}

AttributeSet& AttributeSet::set(const std::string& name, const std::string& value) {
    const std::string stored = (name == attr::kFilename) ? base_name(value) : value;
    for (auto& a : attrs_) {
        if (a.name == name) {
            a.value = stored;
            return *this;
        }
    }
    attrs_.push_back(Attribute{name, stored});
    return *this;
}

bool AttributeSet::unset(const std::string& name) {
    const auto before = attrs_.size();
    attrs_.erase(std::remove_if(attrs_.begin(), attrs_.end(),
                                [&](const Attribute& a) { return a.name == name; }),
                 attrs_.end());
    return attrs_.size() != before;
}

void AttributeSet::sort() {
    std::stable_sort(attrs_.begin(), attrs_.end(), [](const Attribute& a, const Attribute& b) {
        return natural_less(a.name, b.name);
    });
}

std::string AttributeSet::generate_uuid() {
    static thread_local boost::uuids::random_generator generator;
    const std::string id = boost::uuids::to_string(generator());
    set(attr::kUuid, id);
    return id;
}

std::size_t AttributeSet::encoded_size() const {
    std::size_t total = kMagicSize + 2;
    for (const auto& a : attrs_) {
        total += 4 + a.name.size() + a.value.size();
    }
    return total;
}

Result<void> AttributeSet::write_to(OutputSink& out) const {
    if (attrs_.size() > kMaxField) {
        return Err<void>(ErrorCode::InvalidArgument,
            "Too many attributes: " + std::to_string(attrs_.size()));
    }
    for (const auto& a : attrs_) {
        if (a.name.size() > kMaxField || a.value.size() > kMaxField) {
            return Err<void>(ErrorCode::InvalidArgument, "Attribute too long: " + a.name.substr(0, 64));
        }
    }

    if (auto res = out.write(reinterpret_cast<const std::uint8_t*>(kMagic), kMagicSize); res.is_error()) {
        return res;
    }
    std::uint8_t count[2];
    store_be16(count, static_cast<std::uint16_t>(attrs_.size()));
    if (auto res = out.write(count, sizeof(count)); res.is_error()) {
        return res;
    }
    for (const auto& a : attrs_) {
        if (auto res = write_field(out, a.name); res.is_error()) {
            return res;
        }
        if (auto res = write_field(out, a.value); res.is_error()) {
            return res;
        }
    }
    return Ok();
}

Result<void> AttributeSet::read_from(InputStream& in) {
    std::uint8_t magic[kMagicSize];
    auto got = read_full(in, magic, kMagicSize);
    if (got.is_error()) {
        return Err<void>(ErrorCode::Malformed, "Error reading NiFiFF3 header: " + got.error().message);
    }
    if (got.value() == 0) {
        return Err<void>(ErrorCode::EndOfStream, "no more records");
    }
    if (got.value() != kMagicSize) {
        return Err<void>(ErrorCode::Malformed, "Truncated NiFiFF3 header");
    }

    const std::string header(reinterpret_cast<const char*>(magic), kMagicSize);
    if (header == kEofMagic) {
        return Err<void>(ErrorCode::EndOfStream, "NiFiEOF sentinel");
    }
    if (header != kMagic) {
        return Err<void>(ErrorCode::NoHeader, "No NiFiFF3 header found");
    }

    std::uint8_t count_buf[2];
    got = read_full(in, count_buf, sizeof(count_buf));
    if (got.is_error() || got.value() != sizeof(count_buf)) {
        return Err<void>(ErrorCode::Malformed, "Error reading attrCount");
    }

    AttributeSet decoded;
    const auto count = load_be16(count_buf);
    decoded.attrs_.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
        auto name = read_field(in, "attrName");
        if (name.is_error()) {
            return Err<void>(name.error());
        }
        auto value = read_field(in, "attrValue");
        if (value.is_error()) {
            return Err<void>(value.error());
        }
        decoded.set(name.value(), value.value());
    }
    *this = std::move(decoded);
    return Ok();
}

nlohmann::ordered_json AttributeSet::to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& a : attrs_) {
        j[a.name] = a.value;
    }
    return j;
}

Result<AttributeSet> AttributeSet::from_json(const nlohmann::ordered_json& j) {
    AttributeSet out;
    if (j.is_object()) {
        for (const auto& item : j.items()) {
            if (!item.value().is_string()) {
                return Err<AttributeSet>(ErrorCode::InvalidArgument,
                                         "Attribute " + item.key() + " is not a string");
            }
            out.set(item.key(), item.value().get<std::string>());
        }
        return Ok(std::move(out));
    }
    if (j.is_array()) {
        for (const auto& entry : j) {
            if (!entry.is_object() || !entry.contains("name")) {
                return Err<AttributeSet>(ErrorCode::InvalidArgument, "Attribute entry without name");
            }
            out.set(entry.value("name", ""), entry.value("value", ""));
        }
        return Ok(std::move(out));
    }
    return Err<AttributeSet>(ErrorCode::InvalidArgument, "Attributes must be a JSON object or array");
}

Result<AttributeSet> AttributeSet::from_json_string(const std::string& text) {
    try {
        return from_json(nlohmann::ordered_json::parse(text));
    } catch (const nlohmann::json::exception& e) {
        return Err<AttributeSet>(ErrorCode::InvalidArgument, std::string("Invalid attribute JSON: ") + e.what());
    }
}

bool natural_less(const std::string& a, const std::string& b) {
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() && j < b.size()) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[j]);
        if (std::isdigit(ca) && std::isdigit(cb)) {
            auto si = i;
            auto sj = j;
            while (si < a.size() && a[si] == '0') ++si;
            while (sj < b.size() && b[sj] == '0') ++sj;
            auto ei = si;
            auto ej = sj;
            while (ei < a.size() && std::isdigit(static_cast<unsigned char>(a[ei]))) ++ei;
            while (ej < b.size() && std::isdigit(static_cast<unsigned char>(b[ej]))) ++ej;
            if (ei - si != ej - sj) {
                return ei - si < ej - sj;
            }
            const int cmp = a.compare(si, ei - si, b, sj, ej - sj);
            if (cmp != 0) {
                return cmp < 0;
            }
            i = ei;
            j = ej;
            continue;
        }
        const auto la = std::tolower(ca);
        const auto lb = std::tolower(cb);
        if (la != lb) {
            return la < lb;
        }
        ++i;
        ++j;
    }
    if ((a.size() - i) != (b.size() - j)) {
        return (a.size() - i) < (b.size() - j);
    }
    return a < b;
}

} // namespace flowfile
