#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ratchet::detail {

// Process-unique id for a new generator instance.
std::uint64_t next_generator_id() noexcept;

// Whether generator transitions are logged; read once from configuration.
bool tracing() noexcept;

// Log one generator transition.
void trace(std::string_view event, std::uint64_t generator, std::size_t position, std::string_view what = {}) noexcept;

} // namespace ratchet::detail
