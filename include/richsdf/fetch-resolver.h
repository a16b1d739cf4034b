#pragma once

#include <richsdf/segment.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace richsdf {

//=============================================================================
// FetchSource - supplies placeholder values at update time
//
// lookup() is called once per placeholder occurrence per pass, from the
// updating thread. It must not block.
//=============================================================================
class FetchSource {
public:
    virtual ~FetchSource() = default;
    virtual std::optional<std::string> lookup(std::string_view name) = 0;
};

class MapFetchSource : public FetchSource {
public:
    MapFetchSource() = default;
    MapFetchSource(std::initializer_list<std::pair<const std::string, std::string>> values)
        : _values(values) {}

    std::optional<std::string> lookup(std::string_view name) override;

    void set(std::string name, std::string value);
    void erase(std::string_view name);

private:
    std::map<std::string, std::string, std::less<>> _values;
};

class CallbackFetchSource : public FetchSource {
public:
    using Callback = std::function<std::optional<std::string>(std::string_view)>;

    explicit CallbackFetchSource(Callback callback) : _callback(std::move(callback)) {}

    std::optional<std::string> lookup(std::string_view name) override;

private:
    Callback _callback;
};

// A resolved piece of text with its style, ready for shaping
struct StyledRun {
    std::string text;
    SegmentStyle style;
    bool fromPlaceholder = false;
    std::string placeholder;    // Name when fromPlaceholder

    bool operator==(const StyledRun&) const = default;
};

struct ResolvedValue {
    std::string value;
    bool dirty = false;         // Differs from the previous pass

    bool operator==(const ResolvedValue&) const = default;
};

//=============================================================================
// FetchResolver - substitutes placeholders and tracks value changes
//
// Owned per text object. After each resolve() pass, changed() tells whether
// the output may differ from the previous pass; the first pass always
// counts as a change.
//=============================================================================
class FetchResolver {
public:
    using ResolvedText = std::map<std::string, ResolvedValue, std::less<>>;

    std::vector<StyledRun> resolve(const SegmentTree& tree, FetchSource& source);

    bool changed() const { return _changed; }

    // Next pass reports a change even if no value moved
    void invalidate() { _forceChange = true; }

    const ResolvedText& resolved() const { return _resolved; }

    std::optional<std::string> value(std::string_view name) const;

    uint64_t passCount() const { return _passCount; }

private:
    ResolvedText _resolved;
    bool _changed = false;
    bool _forceChange = false;
    uint64_t _passCount = 0;
};

} // namespace richsdf
