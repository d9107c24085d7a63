#include "fragment_index.h"

#include <algorithm>
#include <limits>

namespace {

// Two ranges merge when they intersect after growing each by one byte,
// so [a,b) and [b,c) count as overlapping.
bool touches(const Fragment& a, const Fragment& b) {
    int64_t start = std::max(a.offset, b.offset);
    int64_t stop  = std::min(a.end() + 1, b.end() + 1);
    return start < stop;
}

} // namespace

bool isValidFragment(int64_t offset, int64_t length) {
    if (offset < 0 || length <= 0) {
        return false;
    }
    // Keep end() + 1 representable for the touch test.
    return length < std::numeric_limits<int64_t>::max() - offset;
}

FragmentIndex::FragmentIndex()
    : fragments_(std::make_shared<const std::vector<Fragment>>())
{
}

// ── addFragment ────────────────────────────────────────────────

void FragmentIndex::addFragment(int64_t offset, int64_t length) {
    if (!isValidFragment(offset, length)) {
        return;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = std::atomic_load(&fragments_);
    auto next = std::make_shared<const std::vector<Fragment>>(
        merged(*current, Fragment{offset, length}));
    std::atomic_store(&fragments_, Snapshot(std::move(next)));
}

std::vector<Fragment> FragmentIndex::merged(const std::vector<Fragment>& current,
                                            const Fragment& fragment) {
    std::vector<Fragment> result;
    result.reserve(current.size() + 1);

    size_t i = 0;
    const size_t n = current.size();

    // Strictly before the new range with a gap: kept as is.
    while (i < n && current[i].end() < fragment.offset) {
        result.push_back(current[i]);
        ++i;
    }

    // Overlapping or adjacent run. The input is ascending and non-adjacent,
    // so the run is contiguous and the scan can stop at the first miss.
    Fragment combined = fragment;
    while (i < n && touches(current[i], combined)) {
        int64_t start = std::min(combined.offset, current[i].offset);
        int64_t stop  = std::max(combined.end(), current[i].end());
        combined.offset = start;
        combined.length = stop - start;
        ++i;
    }
    result.push_back(combined);

    // Strictly after with a gap.
    for (; i < n; ++i) {
        result.push_back(current[i]);
    }
    return result;
}

void FragmentIndex::assign(const std::vector<Fragment>& fragments) {
    std::vector<Fragment> rebuilt;
    for (const auto& f : fragments) {
        if (isValidFragment(f.offset, f.length)) {
            rebuilt = merged(rebuilt, f);
        }
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    std::atomic_store(&fragments_,
                      Snapshot(std::make_shared<const std::vector<Fragment>>(std::move(rebuilt))));
}

// ── Readers ────────────────────────────────────────────────────

FragmentIndex::Snapshot FragmentIndex::fragments() const {
    return std::atomic_load(&fragments_);
}

size_t FragmentIndex::size() const {
    return fragments()->size();
}

bool FragmentIndex::empty() const {
    return fragments()->empty();
}

int64_t FragmentIndex::cachedBytes() const {
    auto snapshot = fragments();
    int64_t total = 0;
    for (const auto& f : *snapshot) {
        total += f.length;
    }
    return total;
}

bool FragmentIndex::contains(int64_t offset, int64_t length) const {
    if (!isValidFragment(offset, length)) {
        return false;
    }
    auto snapshot = fragments();
    int64_t stop = offset + length;
    for (const auto& f : *snapshot) {
        if (f.offset > offset) {
            break;
        }
        if (f.end() >= stop) {
            return true;
        }
    }
    return false;
}

std::vector<RangeAction> FragmentIndex::planRange(int64_t offset, int64_t length) const {
    std::vector<RangeAction> actions;
    if (!isValidFragment(offset, length)) {
        return actions;
    }

    auto snapshot = fragments();
    const int64_t stop = offset + length;
    int64_t cursor = offset;

    for (const auto& f : *snapshot) {
        if (f.end() <= cursor) {
            continue;
        }
        if (f.offset >= stop) {
            break;
        }
        if (f.offset > cursor) {
            actions.push_back({RangeSource::Remote, {cursor, f.offset - cursor}});
            cursor = f.offset;
        }
        int64_t local_end = std::min(f.end(), stop);
        actions.push_back({RangeSource::Local, {cursor, local_end - cursor}});
        cursor = local_end;
    }

    if (cursor < stop) {
        actions.push_back({RangeSource::Remote, {cursor, stop - cursor}});
    }
    return actions;
}
