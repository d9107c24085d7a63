#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

/// Offset sentinel for "no position" (e.g. a failed lookup upstream).
constexpr int64_t kNotFound = -1;

/// A half-open byte range [offset, offset + length) of the remote resource.
struct Fragment {
    int64_t offset = 0;
    int64_t length = 0;

    int64_t end() const { return offset + length; }

    bool operator==(const Fragment& other) const {
        return offset == other.offset && length == other.length;
    }
    bool operator!=(const Fragment& other) const { return !(*this == other); }
};

/// True when [offset, offset + length) is a non-empty range with a defined
/// offset whose end (plus the one-byte touch margin) fits in int64_t.
bool isValidFragment(int64_t offset, int64_t length);

enum class RangeSource {
    Local,   // already in the cache file
    Remote   // must be fetched
};

struct RangeAction {
    RangeSource source = RangeSource::Remote;
    Fragment range;

    bool operator==(const RangeAction& other) const {
        return source == other.source && range == other.range;
    }
};

/// Sorted set of downloaded byte ranges.
///
/// After every mutation the sequence is ascending, pairwise non-overlapping
/// and non-adjacent, i.e. the minimal cover of everything ever added.
/// Writers serialize on a mutex, build a new vector and publish it with an
/// atomic shared_ptr store; readers only load the current pointer.
class FragmentIndex {
public:
    using Snapshot = std::shared_ptr<const std::vector<Fragment>>;

    FragmentIndex();

    FragmentIndex(const FragmentIndex&) = delete;
    FragmentIndex& operator=(const FragmentIndex&) = delete;

    /// Insert [offset, offset + length), merging with every fragment it
    /// overlaps or touches. Invalid input is ignored.
    void addFragment(int64_t offset, int64_t length);

    /// Replace the contents with the normalized cover of `fragments`.
    /// Invalid entries are dropped.
    void assign(const std::vector<Fragment>& fragments);

    /// Immutable snapshot of the current sequence.
    Snapshot fragments() const;

    size_t size() const;
    bool empty() const;

    /// Total number of cached bytes.
    int64_t cachedBytes() const;

    /// True when the whole range [offset, offset + length) is cached.
    bool contains(int64_t offset, int64_t length) const;

    /// Split [offset, offset + length) into consecutive local / remote
    /// pieces that cover it exactly. Invalid input yields an empty plan.
    std::vector<RangeAction> planRange(int64_t offset, int64_t length) const;

private:
    static std::vector<Fragment> merged(const std::vector<Fragment>& current,
                                        const Fragment& fragment);

    mutable std::mutex write_mutex_;
    Snapshot fragments_;
};
