//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types for the sysmon gateway
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace sysmon {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON when the input is not a single well-formed JSON document.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses exactly one JSON document (RFC 8259). Leading/trailing whitespace is allowed; any other
//          trailing content, invalid escapes, lone surrogates, raw control characters in strings, leading
//          zeros, or nesting deeper than 128 levels are rejected.
// Returns:
//   Parsed JSONValue. Integers that fit int64_t are stored as int64_t, everything else as double.
// Throws:
//   JSONParseError on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Serializes a JSONValue to compact JSON with object keys in lexical order. Non-finite doubles
//          are written as null.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// JSON object helpers
//==========================================================================================================
// Returns the member pointer when obj has key, else nullptr.
const JSONValue* FindMember(const JSONValue::Object& obj, const std::string& key);

// Inserts key -> value into obj (by copy/move into a fresh shared node).
void SetMember(JSONValue::Object& obj, const std::string& key, JSONValue value);

//==========================================================================================================
// UTF-8 helpers
//==========================================================================================================
// Length of the well-formed UTF-8 sequence starting at s[pos], or 0 when it is malformed (bad lead or
// continuation byte, truncated, overlong, surrogate, or past U+10FFFF).
std::size_t Utf8SequenceLength(const std::string& s, std::size_t pos);

// Copies bytes, replacing every malformed sequence with U+FFFD.
std::string DecodeUtf8Lossy(const std::string& bytes);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Converts an id to its JSON form.
JSONValue IdToJSON(const JSONRPCId& id);

// Renders an id for log lines ("null", "42", "\"abc\"").
std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request as decoded from the wire. A request without an id is a notification.
// Ctors:
//   JSONRPCRequest(id, method, params?): Initializes fields (params optional).
// Methods:
//   IsNotification(): True when no id member was present.
//==========================================================================================================
class JSONRPCRequest {
public:
    std::optional<JSONRPCId> id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(std::optional<JSONRPCId> id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    bool IsNotification() const { return !id.has_value(); }
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
// Methods:
//   ToJSON(): {"jsonrpc":"2.0", id, result|error}.
//   Serialize(): Compact JSON text of ToJSON().
//==========================================================================================================
class JSONRPCResponse {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    JSONValue ToJSON() const;
    std::string Serialize() const;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes used on the wire.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace sysmon
