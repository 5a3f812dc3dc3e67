#ifndef DULCE_LIBCOMPILER_LSP
#define DULCE_LIBCOMPILER_LSP

#include <libutl/utilities.hpp>
#include <libcompiler/fwd.hpp>

namespace du::lsp {

    // https://microsoft.github.io/language-server-protocol/specifications/lsp/3.17/specification/#position
    struct Position {
        std::uint32_t line {};
        std::uint32_t column {};

        auto operator==(Position const&) const -> bool                  = default;
        auto operator<=>(Position const&) const -> std::strong_ordering = default;
    };

    // https://microsoft.github.io/language-server-protocol/specifications/lsp/3.17/specification/#range
    struct Range {
        Position start; // Inclusive
        Position stop;  // Exclusive

        // Deliberately non-aggregate.
        explicit Range(Position start, Position stop);

        auto operator==(Range const&) const -> bool                  = default;
        auto operator<=>(Range const&) const -> std::strong_ordering = default;
    };

    // https://microsoft.github.io/language-server-protocol/specifications/lsp/3.17/specification/#diagnosticSeverity
    enum struct Severity : std::uint8_t { Error, Warning, Hint, Information };

    // https://microsoft.github.io/language-server-protocol/specifications/lsp/3.17/specification/#diagnosticRelatedInformation
    struct Diagnostic_related {
        std::string message;
        Range       range;
    };

    // https://microsoft.github.io/language-server-protocol/specifications/lsp/3.17/specification/#diagnostic
    struct Diagnostic {
        std::string                     message;
        Range                           range;
        Severity                        severity {};
        std::vector<Diagnostic_related> related_info;
    };

    // Create a zero-width range for `position`.
    [[nodiscard]] auto to_range_0(Position position) noexcept -> Range;

    // Construct an error diagnostic.
    [[nodiscard]] auto error(Range range, std::string message) -> Diagnostic;

    // Capitalized severity description.
    [[nodiscard]] auto severity_string(Severity severity) -> std::string_view;

} // namespace du::lsp

template <>
struct std::formatter<du::lsp::Position> {
    static constexpr auto parse(auto& ctx)
    {
        return ctx.begin();
    }

    static auto format(du::lsp::Position const position, auto& ctx)
    {
        return std::format_to(ctx.out(), "{}:{}", position.line + 1, position.column + 1);
    }
};

template <>
struct std::formatter<du::lsp::Range> {
    static constexpr auto parse(auto& ctx)
    {
        return ctx.begin();
    }

    static auto format(du::lsp::Range const& range, auto& ctx)
    {
        return std::format_to(ctx.out(), "{}-{}", range.start, range.stop);
    }
};

#endif // DULCE_LIBCOMPILER_LSP
