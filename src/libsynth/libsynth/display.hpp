#ifndef DULCE_LIBSYNTH_DISPLAY
#define DULCE_LIBSYNTH_DISPLAY

#include <libsynth/synth.hpp>

namespace du::syn {

    struct Display_options {
        bool unicode {};
    };

    // Display the unified tree rooted at `root` in a tree format.
    // The desugared form of a node is shown as its first child.
    auto display(Context& ctx, Node root, Display_options options = {}) -> std::string;

    // Render `node` in surface syntax. Nodes with a desugared form are rendered as that form.
    // Temporaries are named `__synth__0`, `__synth__1`, ... in order of first appearance.
    auto to_source(Context& ctx, Node node) -> std::string;

} // namespace du::syn

#endif // DULCE_LIBSYNTH_DISPLAY
