#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace devready {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kHostError,  // I/O, OS collaborator failure, malformed external input
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: failure reported by the host (filesystem, registry, env file)
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kHostError, .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Warning(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kWarning, .message = std::move(msg)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
        });
    return std::move(*this);
  }

  // Primary message followed by notes, separated by "; ".
  [[nodiscard]] auto Describe() const -> std::string {
    std::string text = primary.message;
    for (const auto& note : notes) {
      text += "; ";
      text += note.message;
    }
    return text;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace devready
