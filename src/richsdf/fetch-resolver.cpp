#include <richsdf/fetch-resolver.h>
#include <ytrace/ytrace.hpp>

#include <set>

namespace richsdf {

//=============================================================================
// Sources
//=============================================================================

std::optional<std::string> MapFetchSource::lookup(std::string_view name) {
    auto it = _values.find(name);
    if (it == _values.end()) return std::nullopt;
    return it->second;
}

void MapFetchSource::set(std::string name, std::string value) {
    _values.insert_or_assign(std::move(name), std::move(value));
}

void MapFetchSource::erase(std::string_view name) {
    auto it = _values.find(name);
    if (it != _values.end()) _values.erase(it);
}

std::optional<std::string> CallbackFetchSource::lookup(std::string_view name) {
    if (!_callback) return std::nullopt;
    return _callback(name);
}

//=============================================================================
// FetchResolver
//=============================================================================

std::vector<StyledRun> FetchResolver::resolve(const SegmentTree& tree, FetchSource& source) {
    std::vector<StyledRun> runs;
    std::set<std::string, std::less<>> seen;
    bool changed = _passCount == 0 || _forceChange;

    for (const Segment* leaf : tree.leaves()) {
        if (leaf->isLiteral()) {
            if (!leaf->text.empty()) {
                runs.push_back(StyledRun{leaf->text, leaf->style, false, {}});
            }
            continue;
        }

        std::string value = source.lookup(leaf->text).value_or(std::string());

        auto [it, inserted] = _resolved.try_emplace(leaf->text);
        ResolvedValue& entry = it->second;
        if (seen.insert(leaf->text).second) {
            // First occurrence this pass: compare with the previous pass
            entry.dirty = inserted || entry.value != value;
        } else if (entry.value != value) {
            entry.dirty = true;
        }
        if (entry.dirty) {
            ydebug("FetchResolver: '{}' -> '{}'", leaf->text, value);
            changed = true;
        }
        entry.value = value;

        if (!value.empty()) {
            runs.push_back(StyledRun{std::move(value), leaf->style, true, leaf->text});
        }
    }

    // Drop names the template no longer references
    for (auto it = _resolved.begin(); it != _resolved.end();) {
        if (seen.contains(it->first)) {
            ++it;
        } else {
            it = _resolved.erase(it);
            changed = true;
        }
    }

    _changed = changed;
    _forceChange = false;
    ++_passCount;
    return runs;
}

std::optional<std::string> FetchResolver::value(std::string_view name) const {
    auto it = _resolved.find(name);
    if (it == _resolved.end()) return std::nullopt;
    return it->second.value;
}

} // namespace richsdf
