/**
 * @file engine.h
 * @brief Foreign-call engine interface and process-wide engine selection.
 *
 * Two engines implement the same primitives:
 * - DeclarativeEngine resolves types against compiled Declarations.
 * - DynamicEngine resolves types against libffi descriptors at call time.
 *
 * The process uses exactly one of them, chosen once by active_engine():
 * the declarative engine if it can start, the dynamic engine otherwise.
 *
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include "dualffi/buffer.h"
#include "dualffi/library.h"
#include "dualffi/native_type.h"
#include "dualffi/types.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dualffi {

enum class EngineKind {
    Declarative = DUALFFI_ENGINE_DECLARATIVE,
    Dynamic     = DUALFFI_ENGINE_DYNAMIC,
};

const char* to_string(EngineKind kind) noexcept;

/**
 * @brief Abstract foreign-call engine.
 *
 * Library arguments passed as pointers may be null, in which case only
 * the engine's built-in types are visible.
 */
class Engine {
public:
    virtual ~Engine() = default;

    virtual EngineKind kind() const noexcept = 0;
    const char* name() const noexcept { return to_string(kind()); }

    /**
     * @brief Resolve a textual type for this engine.
     *
     * @throws UnresolvedTypeError if the name is unknown.
     */
    virtual NativeType resolve(const Library* library, std::string_view type_name) const = 0;

    // -- buffers ------------------------------------------------------------

    /// Buffer of unsigned bytes holding `data`.
    virtual Buffer buffer_from_bytes(const Bytes& data) const = 0;

    /// Null-terminated wchar_t buffer holding `text`.
    virtual Buffer buffer_from_unicode(std::wstring_view text) const = 0;

    /// One-element array of byte pointers whose entry points at `buffer`.
    virtual Buffer buffer_pointer(const Buffer& buffer) const = 0;

    /// Copy of the first `maxlen` bytes, or all of size() when unset.
    virtual Bytes bytes_from_buffer(const Buffer& buffer,
                                    std::optional<std::size_t> maxlen) const = 0;

    /// Copy of `maxlen` bytes at `pointer`, or up to its null terminator when unset.
    virtual Bytes bytes_from_pointer(const Pointer& pointer,
                                     std::optional<std::size_t> maxlen) const = 0;

    /// Bytes before the first null, bounded by size().
    virtual Bytes byte_string_from_buffer(const Buffer& buffer) const = 0;

    /// Byte array to be passed by value.
    virtual Buffer byte_array(const Bytes& byte_string) const = 0;

    virtual Pointer null() const = 0;

    /**
     * @brief True if `pointer` is null, or if it addresses a pointer that
     *        is itself null.
     */
    virtual bool is_null(const Pointer& pointer) const = 0;

    virtual int get_errno() const = 0;
    virtual void set_errno(int value) const = 0;

    // -- values -------------------------------------------------------------

    /**
     * @brief Allocate a zeroed value of `type_name`, optionally initialised.
     *
     * The returned buffer owns the allocation; its pointer() is the new
     * value's address.
     */
    virtual Buffer new_value(const Library* library, std::string_view type_name,
                             const Value& init) const = 0;

    /// Reinterpret `pointer` as `type_name`, which must be a pointer type.
    virtual Pointer cast(const Library* library, std::string_view type_name,
                         const Pointer& pointer) const = 0;

    virtual std::size_t size_of(const Library* library, std::string_view type_name) const = 0;

    /// Value one hop behind `pointer`.
    virtual Value deref(const Pointer& pointer) const = 0;

    /// Contents behind `pointer`; interchangeable with deref().
    virtual Value unwrap(const Pointer& pointer) const = 0;

    // -- structs and arrays --------------------------------------------------

    /// Zeroed instance of struct `name`.
    virtual Buffer make_struct(const Library& library, std::string_view name) const = 0;

    /// In-memory bytes of the struct `struct_pointer` addresses.
    virtual Bytes struct_bytes(const Pointer& struct_pointer) const = 0;

    /**
     * @brief New instance of struct `name` holding the first sizeof(name)
     *        bytes at `source`.
     *
     * `source` must address at least that many bytes.
     */
    virtual Buffer struct_from_buffer(const Library& library, std::string_view name,
                                      const Pointer& source) const = 0;

    /**
     * @brief Decode `size` consecutive elements of `type_name` at `pointer`.
     *
     * String pointer types decode to Bytes (std::wstring for wide types,
     * monostate for null entries). A zero-byte array yields an empty vector
     * without touching `pointer`.
     */
    virtual std::vector<Value> array_from_pointer(const Library& library,
                                                  std::string_view type_name,
                                                  const Pointer& pointer,
                                                  std::size_t size) const = 0;
};

/**
 * @brief Engine selection settings.
 */
struct EngineConfig {
    enum class Preference {
        Auto,         ///< Declarative first, dynamic as fallback
        Declarative,  ///< Only the declarative engine may start
        Dynamic,      ///< Only the dynamic engine may start
    };

    Preference preference = Preference::Auto;

    /// Reads DUALFFI_ENGINE ("auto", "declarative", "dynamic").
    static EngineConfig from_environment();

    /// Unknown or null text maps to Auto with a diagnostic on stderr.
    static Preference parse_preference(const char* text) noexcept;
};

using EngineFactory = std::function<std::unique_ptr<Engine>(const EngineConfig&)>;

/// @throws EngineUnavailable
std::unique_ptr<Engine> make_declarative_engine(const EngineConfig& config);

/// @throws EngineUnavailable
std::unique_ptr<Engine> make_dynamic_engine(const EngineConfig& config);

/// Declarative, then dynamic.
std::vector<EngineFactory> default_engine_factories();

/**
 * @brief Start the first candidate that does not raise EngineUnavailable.
 *
 * @throws FFIEngineError if every candidate is unavailable.
 */
std::unique_ptr<Engine> select_engine(const std::vector<EngineFactory>& candidates,
                                      const EngineConfig& config);

/**
 * @brief The process-wide engine, selected on first use.
 *
 * @throws FFIEngineError if no engine can start.
 */
const Engine& active_engine();

EngineKind engine_kind();
const char* engine_name();

}  // namespace dualffi
