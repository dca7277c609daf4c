#pragma once

#include "app/TickLoop.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace rtop::ui {

// Check whether stdin has input within timeout_ms (clamped to 10..1000)
bool has_input_available(int timeout_ms);

// Translates raw terminal bytes into actions under the active key map.
// Unmapped keys and unknown escape sequences are dropped. Decoding stops after
// a key that leaves the current mode; *consumed receives the bytes used.
std::vector<app::Action> decode_keys(std::string_view bytes, app::InputMode mode,
                                     size_t* consumed = nullptr);

// Reads stdin (raw, non-blocking) and decodes it.
class TerminalInput final : public app::IInputSource {
public:
  bool wait(int timeout_ms) override;
  std::vector<app::Action> read_actions(app::InputMode mode) override;

private:
  std::string pending_; // bytes typed after a mode switch
};

} // namespace rtop::ui
