/* @file Command.cpp
 * @brief frame builders for the power and input command families
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// tvlink headers
#include "protocols/Command.hpp"

using namespace tvlink::protocols;

namespace {
  constexpr int kMinInput = 1;
  constexpr int kMaxInput = 8;
  // input selection carries a 4-digit id followed by a 3-space trailer
  constexpr std::size_t kSelectInputWidth = 7;
} // namespace

std::string Command::toWire() const {
  std::string out = code;
  out += parameter;
  if (parameter.size() < width)
    out.append(width - parameter.size(), ' ');
  out += kTerminator;
  return out;
}

Command Command::powerQuery() { return Command{ "POWR", "????" }; }

Command Command::power(bool on) { return Command{ "POWR", on ? "1" : "0" }; }

Command Command::inputQuery() { return Command{ "IAVD", "?" }; }

Command Command::selectInput(int n) {
  if (n < kMinInput || n > kMaxInput)
    throw std::out_of_range("[Command] input " + std::to_string(n) + " outside 1..8");
  return Command{ "IAVD", "000" + std::to_string(n), kSelectInputWidth };
}

std::string Command::raw(const std::string& text) {
  if (!text.empty() && text.back() == kTerminator)
    return text;
  return text + kTerminator;
}
