// lager_lens.cpp
// Record path lenses built on lager::lens<Value, Value>

#include <record_patch/lager_lens.h>
#include <record_patch/path_utils.h>

#include <zug/compose.hpp>

namespace record_patch {

LagerValueLens record_path_lens(const Path& path)
{
    if (path.empty()) {
        return zug::identity;
    }

    return lager::lenses::getset(
        // Getter: single-pass strict traversal
        [path](const Value& root) -> Value {
            return get_at_path_strict(root, path);
        },
        // Setter: recursive rebuild
        [path](Value root, Value new_val) -> Value {
            return set_at_path_direct(root, path, std::move(new_val));
        }
    );
}

} // namespace record_patch
