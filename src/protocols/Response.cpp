/* @file Response.cpp
 * @brief line classification for OK / ERR / status digit / input id replies
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>

// tvlink headers
#include "protocols/Response.hpp"

using namespace tvlink::protocols;

namespace {

  std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), notSpace);
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return first < last ? std::string(first, last) : std::string{};
  }

  bool allDigits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
  }

} // namespace

std::optional<Response> Response::fromWire(const std::string& line) {
  const std::string text = trim(line);

  if (text == "OK")
    return Response{ Kind::Ok, text, 0 };
  if (text == "ERR")
    return Response{ Kind::Err, text, 0 };
  if (text.size() == 1 && allDigits(text))
    return Response{ Kind::Status, text, text[0] - '0' };
  if (text.size() == 4 && allDigits(text))
    return Response{ Kind::InputId, text, std::stoi(text) };

  return std::nullopt;
}

const char* tvlink::protocols::toString(Response::Kind kind) {
  switch (kind) {
  case Response::Kind::Ok:
    return "OK";
  case Response::Kind::Err:
    return "ERR";
  case Response::Kind::Status:
    return "Status";
  case Response::Kind::InputId:
    return "InputId";
  default:
    return "Unknown";
  }
}
