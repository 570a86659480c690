#pragma once

#include <cstdint>
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace cmdbridge::mcp {

using json = nlohmann::json;

// JSON-RPC 2.0 error codes
namespace error_code {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kServerNotInitialized = -32002;
}  // namespace error_code

json make_error(int code, const std::string& message);

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  std::string method;
  json params = json::object();
  std::optional<json> id;  // nullopt for notifications

  bool is_notification() const {
    return !id.has_value();
  }
};

struct JsonRpcResponse {
  json id;  // echoed unchanged; null when the request id is unknown
  std::optional<json> result;
  std::optional<json> error;

  bool ok() const {
    return !error.has_value();
  }

  std::string error_message() const;

  json to_json() const;

  static JsonRpcResponse success(json id, json result);
  static JsonRpcResponse failure(json id, int code, const std::string& message);
};

// Validate the envelope of one raw incoming message. On failure the error
// holds the response to send back (-32700 or -32600).
Result<JsonRpcRequest, JsonRpcResponse> parse_request(const std::string& raw);

// Largest Content-Length body accepted; bigger headers are treated as malformed
constexpr size_t kMaxMessageBytes = 64 * 1024 * 1024;

// Wire framing of a single message
enum class Framing {
  NewlineDelimited,  // one JSON document per line
  ContentLength,     // "Content-Length: N\r\n\r\n" + body
};

std::string to_string(Framing framing);

// Transport state
enum class TransportState { Open, Closed, Failed };

std::string to_string(TransportState state);

// Abstract server-side transport: one raw message in, one JSON message out
class Transport {
 public:
  virtual ~Transport() = default;

  // Next raw message body; nullopt once the input is exhausted
  virtual std::optional<std::string> read_message() = 0;

  // Returns false if the peer is gone
  virtual bool write_message(const json& message) = 0;

  virtual TransportState state() const = 0;
  virtual bool is_open() const {
    return state() == TransportState::Open;
  }
};

// Stdio transport: reads requests from an input stream and writes responses to
// an output stream. Framing is detected per message; replies use the framing
// of the last message read.
class StdioTransport : public Transport {
 public:
  StdioTransport(std::istream& in, std::ostream& out);

  std::optional<std::string> read_message() override;
  bool write_message(const json& message) override;
  TransportState state() const override;

  Framing framing() const {
    return framing_;
  }

 private:
  std::optional<std::string> read_content_length_body(const std::string& header_line);
  void set_framing(Framing framing);

  std::istream& in_;
  std::ostream& out_;
  Framing framing_ = Framing::NewlineDelimited;
  TransportState state_ = TransportState::Open;
};

}  // namespace cmdbridge::mcp
