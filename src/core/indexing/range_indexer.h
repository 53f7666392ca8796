#pragma once

#include "core/shared/errors.h"

#include <QString>
#include <QtGlobal>

#include <iterator>
#include <optional>

namespace ie {

// Boundary indices of a half-open key interval [xl, xr) inside a sorted
// sequence window [lo, hi):
//   keys in [lo, lower)    are  < xl
//   keys in [lower, upper) are in [xl, xr)
//   keys in [upper, hi)    are >= xr
struct IndexBounds {
    qsizetype lower = 0;
    qsizetype upper = 0;

    qsizetype count() const { return upper - lower; }
};

inline bool operator==(const IndexBounds& a, const IndexBounds& b)
{
    return a.lower == b.lower && a.upper == b.upper;
}

struct IdentityKey {
    template <typename T>
    constexpr const T& operator()(const T& value) const noexcept { return value; }
};

// Double-ended bisection over seq[lo, hi), which must be sorted ascending by
// key(element). key must return something convertible to qint64.
//
// Fails with InvalidRange if xl > xr, and with InvalidIndex if lo is negative
// or [lo, hi) is not a window of seq. An empty window yields {lo, hi}.
//
// The search first narrows [lo, hi) until a midpoint lands inside [xl, xr),
// then bisects each side of that split point independently. When nothing in
// the window falls inside the interval the narrowing collapses onto the
// insertion point and both bounds are equal. O(log n), no allocation.
template <typename Sequence, typename KeyFn = IdentityKey>
std::optional<IndexBounds> findBoundsWithin(const Sequence& seq,
                                            qint64 xl, qint64 xr,
                                            qsizetype lo, qsizetype hi,
                                            KeyFn key = KeyFn{},
                                            Error* errorOut = nullptr)
{
    if (lo < 0) {
        reportError(errorOut, ErrorCode::InvalidIndex,
                    QStringLiteral("lo must not be negative (got %1)").arg(lo));
        return std::nullopt;
    }
    const auto size = static_cast<qsizetype>(std::size(seq));
    if (hi > size || lo > hi) {
        reportError(errorOut, ErrorCode::InvalidIndex,
                    QStringLiteral("window [%1, %2) is outside a sequence of %3 elements")
                        .arg(lo).arg(hi).arg(size));
        return std::nullopt;
    }
    if (xl > xr) {
        reportError(errorOut, ErrorCode::InvalidRange,
                    QStringLiteral("interval requires xl <= xr (got [%1, %2))")
                        .arg(xl).arg(xr));
        return std::nullopt;
    }

    if (lo == hi) {
        return IndexBounds{lo, hi};
    }

    const auto first = std::begin(seq);
    auto keyAt = [&](qsizetype i) -> qint64 {
        return static_cast<qint64>(key(*std::next(first, i)));
    };

    // Narrow both ends until a midpoint falls inside [xl, xr).
    qsizetype split = -1;
    while (lo < hi) {
        const qsizetype mid = lo + (hi - lo) / 2;
        const qint64 v = keyAt(mid);
        if (xl <= v && xr <= v) {
            hi = mid;
        } else if (v < xl && v < xr) {
            lo = mid + 1;
        } else {
            split = mid;
            break;
        }
    }
    if (split < 0) {
        return IndexBounds{lo, lo};
    }

    // Left boundary: first index in [lo, split) with key >= xl.
    qsizetype llo = lo;
    qsizetype lhi = split;
    while (llo < lhi) {
        const qsizetype mid = llo + (lhi - llo) / 2;
        if (keyAt(mid) < xl) {
            llo = mid + 1;
        } else {
            lhi = mid;
        }
    }

    // Right boundary: first index in [split, hi) with key >= xr.
    qsizetype rlo = split;
    qsizetype rhi = hi;
    while (rlo < rhi) {
        const qsizetype mid = rlo + (rhi - rlo) / 2;
        if (xr <= keyAt(mid)) {
            rhi = mid;
        } else {
            rlo = mid + 1;
        }
    }

    return IndexBounds{llo, rlo};
}

// findBoundsWithin over the whole sequence.
template <typename Sequence, typename KeyFn = IdentityKey>
std::optional<IndexBounds> findBounds(const Sequence& seq,
                                      qint64 xl, qint64 xr,
                                      KeyFn key = KeyFn{},
                                      Error* errorOut = nullptr)
{
    return findBoundsWithin(seq, xl, xr, 0, static_cast<qsizetype>(std::size(seq)),
                            key, errorOut);
}

} // namespace ie
