#pragma once

#include "flowfile/core/io.hpp"
#include "flowfile/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace flowfile {

/// Attribute names the protocol itself reads or writes.
namespace attr {
inline constexpr const char* kUuid = "uuid";
inline constexpr const char* kFilename = "filename";
inline constexpr const char* kPath = "path";
inline constexpr const char* kKind = "kind";
inline constexpr const char* kTarget = "target";
inline constexpr const char* kChecksum = "checksum";
inline constexpr const char* kChecksumType = "checksumType";
inline constexpr const char* kFragmentIdentifier = "fragment.identifier";
inline constexpr const char* kFragmentOffset = "fragment.offset";
inline constexpr const char* kFragmentIndex = "fragment.index";
inline constexpr const char* kFragmentCount = "fragment.count";
inline constexpr const char* kOriginalSize = "segment.original.size";
inline constexpr const char* kOriginalFilename = "segment.original.filename";
inline constexpr const char* kOriginalChecksum = "segment.original.checksum";
inline constexpr const char* kOriginalChecksumType = "segment.original.checksumType";
inline constexpr const char* kLastModifiedTime = "file.lastModifiedTime";
inline constexpr const char* kCreationTime = "file.creationTime";
inline constexpr const char* kPermissions = "file.permissions";
} // namespace attr

struct Attribute {
    std::string name;
    std::string value;

    bool operator==(const Attribute& other) const {
        return name == other.name && value == other.value;
    }
};

/**
 * @brief Ordered name/value metadata of one FlowFile
 *
 * Insertion order is preserved and is the order written on the wire. Names
 * are unique: set() overwrites the first entry with the same name.
 *
 * Wire layout produced by write_to():
 *   "NiFiFF3" | u16 count | (u16 len, name, u16 len, value)*
 * all integers big-endian.
 */
class AttributeSet {
public:
    static constexpr const char kMagic[] = "NiFiFF3";
    static constexpr const char kEofMagic[] = "NiFiEOF";
    static constexpr std::size_t kMagicSize = 7;

    using const_iterator = std::vector<Attribute>::const_iterator;

    AttributeSet() = default;
    AttributeSet(std::initializer_list<Attribute> attrs);

    /// Value of the first attribute named @p name, or "" if absent.
    std::string get(const std::string& name) const;
    bool has(const std::string& name) const;

    /**
     * @brief Set @p name to @p value, appending when absent
     *
     * Values stored under "filename" keep only the last path component.
     * Returns *this for chaining.
     */
    AttributeSet& set(const std::string& name, const std::string& value);

    /// Remove every attribute named @p name; true if any was removed.
    bool unset(const std::string& name);

    AttributeSet clone() const { return *this; }

    /// Natural ordering by name: case-insensitive, digit runs compared numerically.
    void sort();

    /// Stamp a fresh random uuid and return it.
    std::string generate_uuid();

    std::size_t size() const noexcept { return attrs_.size(); }
    bool empty() const noexcept { return attrs_.empty(); }
    const_iterator begin() const noexcept { return attrs_.begin(); }
    const_iterator end() const noexcept { return attrs_.end(); }
    const Attribute& operator[](std::size_t i) const { return attrs_[i]; }

    bool operator==(const AttributeSet& other) const { return attrs_ == other.attrs_; }
    bool operator!=(const AttributeSet& other) const { return !(*this == other); }

    /// Encoded length of the header produced by write_to().
    std::size_t encoded_size() const;

    Result<void> write_to(OutputSink& out) const;

    /**
     * @brief Replace the contents with an attribute block decoded from @p in
     *
     * Errors: EndOfStream on clean EOF or the "NiFiEOF" sentinel, NoHeader
     * when the magic is unknown, Malformed when a field is truncated.
     */
    Result<void> read_from(InputStream& in);

    nlohmann::ordered_json to_json() const;

    /// Accepts {"name": "value", ...} or [{"name": n, "value": v}, ...].
    static Result<AttributeSet> from_json(const nlohmann::ordered_json& j);
    static Result<AttributeSet> from_json_string(const std::string& text);

private:
    std::vector<Attribute> attrs_;
};

/// Natural "less than" used by AttributeSet::sort().
bool natural_less(const std::string& a, const std::string& b);

} // namespace flowfile
