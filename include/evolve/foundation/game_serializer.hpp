#pragma once

/// @file game_serializer.hpp
/// @brief GameSerializer providing binary/JSON serialization with schema
///        versioning and compile-time field registration via EVOLVE_SERIALIZABLE.
///
/// Field types may be arithmetic, bool, enum, std::string, another
/// registered struct, or a std::vector of any of these.

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <vector>

#include "evolve/foundation/game_result.hpp"

namespace evolve::foundation {

/// Specialization point for compile-time field registration.
/// Users specialize this via the EVOLVE_SERIALIZABLE macro.
template <typename T>
struct SerializableTraits {
    static constexpr bool is_serializable = false;
};

// ── Field descriptor ────────────────────────────────────────────────────────

/// Describes a single serializable field: its name and pointer-to-member.
template <typename T, typename M>
struct FieldDescriptor {
    const char* name;
    M T::*pointer;
};

template <typename T, typename M>
constexpr FieldDescriptor<T, M> field(const char* name, M T::*ptr) {
    return {name, ptr};
}

namespace detail {

template <typename T, typename = void>
struct is_serializable : std::false_type {};

template <typename T>
struct is_serializable<
    T, std::void_t<decltype(SerializableTraits<T>::schema_version)>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_serializable_v = is_serializable<T>::value;

template <typename T>
struct is_vector : std::false_type {};

template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
inline constexpr bool is_vector_v = is_vector<T>::value;

template <typename T>
constexpr uint32_t fieldCount() {
    return static_cast<uint32_t>(
        std::tuple_size_v<decltype(SerializableTraits<T>::fields())>);
}

// ── Tuple iteration ─────────────────────────────────────────────────────

template <typename Tuple, typename Func, std::size_t... Is>
void forEachFieldImpl(const Tuple& t, Func&& f, std::index_sequence<Is...>) {
    (f(std::get<Is>(t), Is), ...);
}

template <typename Tuple, typename Func>
void forEachField(const Tuple& t, Func&& f) {
    forEachFieldImpl(
        t, std::forward<Func>(f),
        std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

// ── Binary write ────────────────────────────────────────────────────────

inline void writeBytes(std::vector<uint8_t>& buf, const void* data,
                       std::size_t n) {
    const auto* p = static_cast<const uint8_t*>(data);
    buf.insert(buf.end(), p, p + n);
}

template <typename T>
void writePrimitive(std::vector<uint8_t>& buf, const T& val) {
    writeBytes(buf, &val, sizeof(T));
}

template <typename T>
void writeBinaryField(std::vector<uint8_t>& buf, const T& val);

template <typename T>
void writeBinaryFields(std::vector<uint8_t>& buf, const T& obj) {
    writePrimitive(buf, fieldCount<T>());
    forEachField(SerializableTraits<T>::fields(), [&](const auto& fd, std::size_t) {
        writeBinaryField(buf, obj.*(fd.pointer));
    });
}

template <typename T>
void writeBinaryField(std::vector<uint8_t>& buf, const T& val) {
    if constexpr (std::is_same_v<T, bool>) {
        uint8_t b = val ? 1 : 0;
        writePrimitive(buf, b);
    } else if constexpr (std::is_same_v<T, std::string>) {
        writePrimitive(buf, static_cast<uint32_t>(val.size()));
        writeBytes(buf, val.data(), val.size());
    } else if constexpr (std::is_enum_v<T>) {
        writePrimitive(buf, static_cast<std::underlying_type_t<T>>(val));
    } else if constexpr (std::is_arithmetic_v<T>) {
        writePrimitive(buf, val);
    } else if constexpr (is_vector_v<T>) {
        writePrimitive(buf, static_cast<uint32_t>(val.size()));
        for (const auto& element : val) {
            writeBinaryField(buf, element);
        }
    } else {
        static_assert(is_serializable_v<T>, "unsupported field type");
        writeBinaryFields(buf, val);
    }
}

// ── Binary read ─────────────────────────────────────────────────────────

struct BinaryReader {
    std::span<const uint8_t> data;
    std::size_t pos = 0;

    [[nodiscard]] bool canRead(std::size_t n) const {
        return n <= data.size() - pos;
    }

    [[nodiscard]] std::size_t remaining() const { return data.size() - pos; }

    template <typename T>
    bool readPrimitive(T& val) {
        if (!canRead(sizeof(T))) return false;
        std::memcpy(&val, data.data() + pos, sizeof(T));
        pos += sizeof(T);
        return true;
    }

    bool readString(std::string& val) {
        uint32_t len = 0;
        if (!readPrimitive(len)) return false;
        if (!canRead(len)) return false;
        val.assign(reinterpret_cast<const char*>(data.data() + pos), len);
        pos += len;
        return true;
    }
};

template <typename T>
bool readBinaryField(BinaryReader& reader, T& val);

/// Read @p storedCount fields into @p obj. Fields beyond storedCount keep
/// their defaults; more stored fields than the type knows cannot be skipped.
template <typename T>
bool readBinaryFields(BinaryReader& reader, T& obj, uint32_t storedCount) {
    if (storedCount > fieldCount<T>()) return false;
    bool ok = true;
    forEachField(SerializableTraits<T>::fields(), [&](const auto& fd, std::size_t idx) {
        if (ok && static_cast<uint32_t>(idx) < storedCount) {
            ok = readBinaryField(reader, obj.*(fd.pointer));
        }
    });
    return ok;
}

template <typename T>
bool readBinaryField(BinaryReader& reader, T& val) {
    if constexpr (std::is_same_v<T, bool>) {
        uint8_t b = 0;
        if (!reader.readPrimitive(b)) return false;
        val = (b != 0);
        return true;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return reader.readString(val);
    } else if constexpr (std::is_enum_v<T>) {
        std::underlying_type_t<T> raw{};
        if (!reader.readPrimitive(raw)) return false;
        val = static_cast<T>(raw);
        return true;
    } else if constexpr (std::is_arithmetic_v<T>) {
        return reader.readPrimitive(val);
    } else if constexpr (is_vector_v<T>) {
        uint32_t count = 0;
        if (!reader.readPrimitive(count)) return false;
        // Every element occupies at least one byte.
        if (count > reader.remaining()) return false;
        val.clear();
        val.resize(count);
        for (auto& element : val) {
            if (!readBinaryField(reader, element)) return false;
        }
        return true;
    } else {
        static_assert(is_serializable_v<T>, "unsupported field type");
        uint32_t storedCount = 0;
        if (!reader.readPrimitive(storedCount)) return false;
        return readBinaryFields(reader, val, storedCount);
    }
}

// ── JSON write ──────────────────────────────────────────────────────────

inline std::string escapeJson(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    return out;
}

template <typename T>
void writeJsonValue(std::ostringstream& out, const T& val);

template <typename T>
void writeJsonMembers(std::ostringstream& out, const T& obj, bool leadingComma) {
    forEachField(SerializableTraits<T>::fields(), [&](const auto& fd, std::size_t idx) {
        if (leadingComma || idx > 0) {
            out << ',';
        }
        out << '"' << fd.name << "\":";
        writeJsonValue(out, obj.*(fd.pointer));
    });
}

template <typename T>
void writeJsonValue(std::ostringstream& out, const T& val) {
    if constexpr (std::is_same_v<T, bool>) {
        out << (val ? "true" : "false");
    } else if constexpr (std::is_same_v<T, std::string>) {
        out << '"' << escapeJson(val) << '"';
    } else if constexpr (std::is_enum_v<T>) {
        out << static_cast<int64_t>(val);
    } else if constexpr (std::is_floating_point_v<T>) {
        out << val;
    } else if constexpr (std::is_signed_v<T>) {
        out << static_cast<int64_t>(val);
    } else if constexpr (std::is_unsigned_v<T>) {
        out << static_cast<uint64_t>(val);
    } else if constexpr (is_vector_v<T>) {
        out << '[';
        for (std::size_t i = 0; i < val.size(); ++i) {
            if (i > 0) out << ',';
            writeJsonValue(out, val[i]);
        }
        out << ']';
    } else {
        static_assert(is_serializable_v<T>, "unsupported field type");
        out << '{';
        writeJsonMembers(out, val, false);
        out << '}';
    }
}

// ── JSON read ───────────────────────────────────────────────────────────

struct JsonReader {
    std::string_view data;
    std::size_t pos = 0;

    void skipWhitespace() {
        while (pos < data.size() &&
               (data[pos] == ' ' || data[pos] == '\t' ||
                data[pos] == '\n' || data[pos] == '\r')) {
            ++pos;
        }
    }

    [[nodiscard]] bool peek(char c) {
        skipWhitespace();
        return pos < data.size() && data[pos] == c;
    }

    bool expect(char c) {
        if (peek(c)) {
            ++pos;
            return true;
        }
        return false;
    }

    bool readQuotedString(std::string& out) {
        skipWhitespace();
        if (pos >= data.size() || data[pos] != '"') return false;
        ++pos;
        out.clear();
        while (pos < data.size() && data[pos] != '"') {
            if (data[pos] == '\\') {
                ++pos;
                if (pos >= data.size()) return false;
                switch (data[pos]) {
                    case 'b':  out += '\b'; break;
                    case 'f':  out += '\f'; break;
                    case 'n':  out += '\n'; break;
                    case 'r':  out += '\r'; break;
                    case 't':  out += '\t'; break;
                    default:   out += data[pos]; break;
                }
            } else {
                out += data[pos];
            }
            ++pos;
        }
        if (pos >= data.size()) return false;
        ++pos;
        return true;
    }

    /// Read a scalar token. Strings are returned unescaped, numbers and
    /// literals as raw text.
    bool readRawValue(std::string& out) {
        skipWhitespace();
        if (pos >= data.size()) return false;
        if (data[pos] == '"') {
            return readQuotedString(out);
        }
        std::size_t start = pos;
        while (pos < data.size() && data[pos] != ',' && data[pos] != '}' &&
               data[pos] != ']' && data[pos] != ' ' && data[pos] != '\t' &&
               data[pos] != '\n' && data[pos] != '\r') {
            ++pos;
        }
        out = std::string(data.substr(start, pos - start));
        return !out.empty();
    }

    /// Skip any value, including nested objects and arrays.
    bool skipValue() {
        skipWhitespace();
        if (pos >= data.size()) return false;
        if (data[pos] == '"') {
            std::string dummy;
            return readQuotedString(dummy);
        }
        if (data[pos] == '{' || data[pos] == '[') {
            int depth = 0;
            while (pos < data.size()) {
                char c = data[pos];
                if (c == '"') {
                    std::string dummy;
                    if (!readQuotedString(dummy)) return false;
                    continue;
                }
                if (c == '{' || c == '[') ++depth;
                if (c == '}' || c == ']') --depth;
                ++pos;
                if (depth == 0) return true;
            }
            return false;
        }
        std::string dummy;
        return readRawValue(dummy);
    }
};

template <typename T>
bool parseJsonScalar(const std::string& raw, T& val) {
    if constexpr (std::is_same_v<T, bool>) {
        if (raw == "true") { val = true; return true; }
        if (raw == "false") { val = false; return true; }
        return false;
    } else if constexpr (std::is_same_v<T, std::string>) {
        val = raw;
        return true;
    } else {
        try {
            if constexpr (std::is_enum_v<T>) {
                val = static_cast<T>(std::stoll(raw));
            } else if constexpr (std::is_same_v<T, float>) {
                val = std::stof(raw);
            } else if constexpr (std::is_floating_point_v<T>) {
                val = std::stod(raw);
            } else if constexpr (std::is_signed_v<T>) {
                val = static_cast<T>(std::stoll(raw));
            } else {
                val = static_cast<T>(std::stoull(raw));
            }
            return true;
        } catch (const std::logic_error&) {
            return false;
        }
    }
}

template <typename T>
bool readJsonValue(JsonReader& reader, T& val);

/// Parse an object into @p obj. Unknown keys are skipped, missing keys keep
/// their defaults. A "__v" member is stored in @p version when given.
template <typename T>
bool readJsonObject(JsonReader& reader, T& obj, uint32_t* version = nullptr) {
    if (!reader.expect('{')) return false;
    if (reader.expect('}')) return true;

    do {
        std::string key;
        if (!reader.readQuotedString(key)) return false;
        if (!reader.expect(':')) return false;

        if (key == "__v") {
            std::string raw;
            uint32_t stored = 0;
            if (!reader.readRawValue(raw) || !parseJsonScalar(raw, stored)) return false;
            if (version != nullptr) *version = stored;
            continue;
        }

        bool matched = false;
        bool ok = true;
        forEachField(SerializableTraits<T>::fields(), [&](const auto& fd, std::size_t) {
            if (matched || key != fd.name) return;
            matched = true;
            ok = readJsonValue(reader, obj.*(fd.pointer));
        });
        if (!ok) return false;
        if (!matched && !reader.skipValue()) return false;
    } while (reader.expect(','));

    return reader.expect('}');
}

template <typename T>
bool readJsonValue(JsonReader& reader, T& val) {
    if constexpr (is_vector_v<T>) {
        if (!reader.expect('[')) return false;
        val.clear();
        if (reader.expect(']')) return true;
        do {
            typename T::value_type element{};
            if (!readJsonValue(reader, element)) return false;
            val.push_back(std::move(element));
        } while (reader.expect(','));
        return reader.expect(']');
    } else if constexpr (is_serializable_v<T>) {
        return readJsonObject(reader, val);
    } else {
        std::string raw;
        return reader.readRawValue(raw) && parseJsonScalar(raw, val);
    }
}

}  // namespace detail

// ── Binary format constants ─────────────────────────────────────────────────

/// Magic bytes identifying the engine's binary serialization format.
inline constexpr uint8_t kBinaryMagic[4] = {'E', 'V', 'O', 'B'};

// ── GameSerializer ──────────────────────────────────────────────────────────

/// Serializer providing binary and JSON encoding with schema versioning.
///
/// Binary layout: magic, schema version (u32), field count (u32), then the
/// fields in declaration order. Nested structs carry their own field count;
/// vectors a u32 element count. Data written by an older schema with fewer
/// trailing fields loads with defaults; data from a newer schema is refused.
///
/// Example:
/// @code
///   struct ValueEntry {
///       std::string state;
///       uint32_t skill = 0;
///       float value = 1.0f;
///   };
///   EVOLVE_SERIALIZABLE(ValueEntry, 1,
///       field("state", &ValueEntry::state),
///       field("skill", &ValueEntry::skill),
///       field("value", &ValueEntry::value)
///   );
///
///   GameSerializer s;
///   auto bin = s.serializeBinary(entry);
///   auto back = s.deserializeBinary<ValueEntry>(bin);
/// @endcode
class GameSerializer {
public:
    GameSerializer();
    ~GameSerializer();

    GameSerializer(const GameSerializer&) = delete;
    GameSerializer& operator=(const GameSerializer&) = delete;
    GameSerializer(GameSerializer&&) noexcept;
    GameSerializer& operator=(GameSerializer&&) noexcept;

    // ── Binary serialization ────────────────────────────────────────────

    template <typename T>
    [[nodiscard]] std::vector<uint8_t> serializeBinary(const T& obj) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with EVOLVE_SERIALIZABLE");

        std::vector<uint8_t> buf;
        buf.reserve(128);
        detail::writeBytes(buf, kBinaryMagic, 4);
        uint32_t version = SerializableTraits<T>::schema_version;
        detail::writePrimitive(buf, version);
        detail::writeBinaryFields(buf, obj);
        return buf;
    }

    /// Deserialize from binary format.
    /// @return The object, InvalidBinaryData for truncated or malformed
    ///         input, or UnsupportedSchemaVersion for data newer than T.
    template <typename T>
    [[nodiscard]] GameResult<T> deserializeBinary(
        std::span<const uint8_t> data) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with EVOLVE_SERIALIZABLE");

        detail::BinaryReader reader{data};

        uint8_t magic[4]{};
        for (auto& m : magic) {
            if (!reader.readPrimitive(m)) {
                return GameResult<T>::err(GameError(
                    ErrorCode::InvalidBinaryData, "truncated binary header"));
            }
        }
        if (std::memcmp(magic, kBinaryMagic, 4) != 0) {
            return GameResult<T>::err(
                GameError(ErrorCode::InvalidBinaryData, "invalid magic bytes"));
        }

        uint32_t version = 0;
        if (!reader.readPrimitive(version)) {
            return GameResult<T>::err(GameError(
                ErrorCode::InvalidBinaryData, "truncated version field"));
        }
        if (version > SerializableTraits<T>::schema_version) {
            return GameResult<T>::err(GameError(
                ErrorCode::UnsupportedSchemaVersion,
                "stored schema version " + std::to_string(version) +
                    " is newer than supported version " +
                    std::to_string(SerializableTraits<T>::schema_version)));
        }

        uint32_t storedFieldCount = 0;
        if (!reader.readPrimitive(storedFieldCount)) {
            return GameResult<T>::err(GameError(
                ErrorCode::InvalidBinaryData, "truncated field count"));
        }

        T obj{};
        if (!detail::readBinaryFields(reader, obj, storedFieldCount)) {
            return GameResult<T>::err(GameError(
                ErrorCode::InvalidBinaryData, "malformed or truncated field data"));
        }
        return GameResult<T>::ok(std::move(obj));
    }

    // ── JSON serialization ──────────────────────────────────────────────

    /// Serialize to a JSON object with a leading "__v" schema version.
    template <typename T>
    [[nodiscard]] std::string serializeJson(const T& obj) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with EVOLVE_SERIALIZABLE");

        std::ostringstream out;
        out << "{\"__v\":" << SerializableTraits<T>::schema_version;
        detail::writeJsonMembers(out, obj, true);
        out << '}';
        return out.str();
    }

    /// Deserialize from JSON. Unknown keys are skipped; missing keys retain
    /// default values.
    template <typename T>
    [[nodiscard]] GameResult<T> deserializeJson(std::string_view json) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with EVOLVE_SERIALIZABLE");

        detail::JsonReader reader{json};
        T obj{};
        uint32_t version = 0;
        if (!detail::readJsonObject(reader, obj, &version)) {
            return GameResult<T>::err(GameError(
                ErrorCode::InvalidJsonData,
                "malformed JSON near offset " + std::to_string(reader.pos)));
        }
        if (version > SerializableTraits<T>::schema_version) {
            return GameResult<T>::err(GameError(
                ErrorCode::UnsupportedSchemaVersion,
                "stored schema version " + std::to_string(version) + " is not supported"));
        }
        return GameResult<T>::ok(std::move(obj));
    }

    /// Access the global GameSerializer instance.
    static GameSerializer& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace evolve::foundation

// ── EVOLVE_SERIALIZABLE macro ───────────────────────────────────────────────
/// Register a type for serialization with field descriptors and version.
/// Must be used at global namespace scope.
///
/// @param Type     The struct type to register.
/// @param Version  Schema version number (uint32_t).
/// @param ...      field("name", &Type::member) descriptors.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define EVOLVE_SERIALIZABLE(Type, Version, ...)                                \
    template <>                                                                \
    struct evolve::foundation::SerializableTraits<Type> {                      \
        static constexpr bool is_serializable = true;                          \
        static constexpr uint32_t schema_version = Version;                    \
        static constexpr auto fields() {                                       \
            using evolve::foundation::field;                                   \
            return std::make_tuple(__VA_ARGS__);                               \
        }                                                                      \
    }
