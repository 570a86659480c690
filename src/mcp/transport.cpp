#include "mcp/transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace cmdbridge::mcp {

namespace {

constexpr const char *kContentLengthHeader = "content-length:";

std::string strip_cr(std::string line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

bool is_blank(const std::string &line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

bool starts_with_content_length(const std::string &line) {
  std::string prefix = line.substr(0, std::char_traits<char>::length(kContentLengthHeader));
  std::transform(prefix.begin(), prefix.end(), prefix.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return prefix == kContentLengthHeader;
}

// Child output is arbitrary bytes; never let invalid UTF-8 abort a reply
std::string dump_message(const json &message) {
  return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Header value: optional surrounding blanks, then decimal digits only,
// no larger than kMaxMessageBytes
std::optional<size_t> parse_content_length(const std::string &value) {
  size_t begin = value.find_first_not_of(" \t");
  size_t end = value.find_last_not_of(" \t");
  if (begin == std::string::npos) return std::nullopt;

  size_t length = 0;
  for (size_t i = begin; i <= end; ++i) {
    char c = value[i];
    if (c < '0' || c > '9') return std::nullopt;
    length = length * 10 + static_cast<size_t>(c - '0');
    if (length > kMaxMessageBytes) return std::nullopt;
  }
  return length;
}

}  // namespace

// ============================================================
// JSON-RPC 2.0 serialization
// ============================================================

json make_error(int code, const std::string &message) {
  return json{{"code", code}, {"message", message}};
}

std::string JsonRpcResponse::error_message() const {
  if (!error.has_value()) return "";
  auto &err = error.value();
  if (err.contains("message")) {
    return err["message"].get<std::string>();
  }
  return err.dump();
}

json JsonRpcResponse::to_json() const {
  json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  if (error.has_value()) {
    j["error"] = *error;
  } else {
    j["result"] = result.value_or(json::object());
  }
  return j;
}

JsonRpcResponse JsonRpcResponse::success(json id, json result) {
  JsonRpcResponse resp;
  resp.id = std::move(id);
  resp.result = std::move(result);
  return resp;
}

JsonRpcResponse JsonRpcResponse::failure(json id, int code, const std::string &message) {
  JsonRpcResponse resp;
  resp.id = std::move(id);
  resp.error = make_error(code, message);
  return resp;
}

Result<JsonRpcRequest, JsonRpcResponse> parse_request(const std::string &raw) {
  using R = Result<JsonRpcRequest, JsonRpcResponse>;

  json msg;
  try {
    msg = json::parse(raw);
  } catch (const json::parse_error &e) {
    return R::failure(JsonRpcResponse::failure(nullptr, error_code::kParseError, std::string("Parse error: ") + e.what()));
  }

  if (msg.is_array()) {
    return R::failure(JsonRpcResponse::failure(nullptr, error_code::kInvalidRequest, "Batch requests are not supported"));
  }
  if (!msg.is_object()) {
    return R::failure(JsonRpcResponse::failure(nullptr, error_code::kInvalidRequest, "Request must be a JSON object"));
  }

  JsonRpcRequest req;
  if (msg.contains("id")) {
    const auto &id = msg["id"];
    if (!id.is_string() && !id.is_number() && !id.is_null()) {
      return R::failure(JsonRpcResponse::failure(nullptr, error_code::kInvalidRequest, "Invalid id type"));
    }
    req.id = id;
  }
  json reply_id = req.id.value_or(nullptr);

  auto version = msg.find("jsonrpc");
  if (version == msg.end() || *version != "2.0") {
    return R::failure(JsonRpcResponse::failure(reply_id, error_code::kInvalidRequest, "Missing or unsupported jsonrpc version"));
  }

  auto method = msg.find("method");
  if (method == msg.end() || !method->is_string()) {
    return R::failure(JsonRpcResponse::failure(reply_id, error_code::kInvalidRequest, "Missing method"));
  }
  req.method = method->get<std::string>();

  auto params = msg.find("params");
  if (params != msg.end() && !params->is_null()) {
    if (!params->is_object() && !params->is_array()) {
      return R::failure(JsonRpcResponse::failure(reply_id, error_code::kInvalidRequest, "params must be an object or array"));
    }
    req.params = *params;
  }

  return R::success(std::move(req));
}

std::string to_string(Framing framing) {
  switch (framing) {
    case Framing::NewlineDelimited:
      return "NewlineDelimited";
    case Framing::ContentLength:
      return "ContentLength";
  }
  return "Unknown";
}

std::string to_string(TransportState state) {
  switch (state) {
    case TransportState::Open:
      return "Open";
    case TransportState::Closed:
      return "Closed";
    case TransportState::Failed:
      return "Failed";
  }
  return "Unknown";
}

// ============================================================
// StdioTransport
// ============================================================

StdioTransport::StdioTransport(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

std::optional<std::string> StdioTransport::read_message() {
  if (state_ != TransportState::Open) return std::nullopt;

  std::string line;
  while (std::getline(in_, line)) {
    line = strip_cr(std::move(line));
    if (is_blank(line)) continue;

    if (starts_with_content_length(line)) {
      return read_content_length_body(line);
    }

    set_framing(Framing::NewlineDelimited);
    return line;
  }

  spdlog::debug("[MCP] Input stream closed");
  state_ = TransportState::Closed;
  return std::nullopt;
}

std::optional<std::string> StdioTransport::read_content_length_body(const std::string &header_line) {
  auto content_length = parse_content_length(header_line.substr(std::char_traits<char>::length(kContentLengthHeader)));
  if (!content_length) {
    spdlog::warn("[MCP] Malformed Content-Length header '{}'", header_line);
    // Hand the header back as the message so it is reported as a parse error
    return header_line;
  }

  // Skip any remaining headers up to the blank separator line
  std::string line;
  while (std::getline(in_, line)) {
    if (strip_cr(line).empty()) break;
  }
  if (!in_) {
    state_ = TransportState::Closed;
    return std::nullopt;
  }

  std::string body(*content_length, '\0');
  in_.read(body.data(), static_cast<std::streamsize>(*content_length));
  if (static_cast<size_t>(in_.gcount()) != *content_length) {
    spdlog::warn("[MCP] Input closed after {} of {} body bytes", in_.gcount(), *content_length);
    state_ = TransportState::Closed;
    return std::nullopt;
  }

  set_framing(Framing::ContentLength);
  return body;
}

void StdioTransport::set_framing(Framing framing) {
  if (framing != framing_) {
    spdlog::debug("[MCP] Framing {} -> {}", to_string(framing_), to_string(framing));
    framing_ = framing;
  }
}

bool StdioTransport::write_message(const json &message) {
  if (state_ == TransportState::Failed) return false;

  std::string body = dump_message(message);
  if (framing_ == Framing::ContentLength) {
    out_ << "Content-Length: " << body.size() << "\r\n\r\n" << body;
  } else {
    out_ << body << "\n";
  }
  out_.flush();

  if (!out_) {
    spdlog::error("[MCP] Write failed, output stream is closed");
    state_ = TransportState::Failed;
    return false;
  }
  return true;
}

TransportState StdioTransport::state() const {
  return state_;
}

}  // namespace cmdbridge::mcp
