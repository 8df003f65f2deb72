/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CBreakpointTree.h>

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <maths/CSegmentationErrors.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace segreg {
namespace maths {
namespace {
std::string toString(double x) {
    return core::CStringUtils::typeToStringPrecise(x, 17);
}
}

std::string CBreakpointTree::SSegment::print() const {
    std::ostringstream result;
    result << "[" << s_Lower << ", " << s_Upper << ") samples [" << s_Begin
           << ", " << s_End << ") depth " << s_Depth << ": " << s_Fit.print();
    return result.str();
}

CBreakpointTree::CBreakpointTree(TDatasetCPtr dataset, std::size_t minimumSegmentSize)
    : m_Dataset{std::move(dataset)},
      m_MinimumSegmentSize{std::max(minimumSegmentSize, MINIMUM_SEGMENT_SIZE)} {
    if (m_Dataset == nullptr) {
        throw std::invalid_argument("Missing dataset");
    }

    SSegment root;
    root.s_Begin = 0;
    root.s_End = m_Dataset->size();
    root.s_Lower = m_Dataset->minimumAbscissa();
    root.s_Upper = m_Dataset->maximumAbscissa();
    root.s_Fit = CSegmentFitter::fit(*m_Dataset, root.s_Begin, root.s_End);
    m_Segments.emplace(root.s_Lower, root);
}

void CBreakpointTree::insert(double breakpoint) {
    if (std::isfinite(breakpoint) == false) {
        throw CInvalidBreakpointError{"Breakpoint " + toString(breakpoint) + " is not finite"};
    }
    if (breakpoint <= m_Dataset->minimumAbscissa() || breakpoint >= m_Dataset->maximumAbscissa()) {
        throw CInvalidBreakpointError{"Breakpoint " + toString(breakpoint) +
                                      " is outside (" + toString(m_Dataset->minimumAbscissa()) +
                                      ", " + toString(m_Dataset->maximumAbscissa()) + ")"};
    }
    if (this->contains(breakpoint)) {
        throw CInvalidBreakpointError{"Duplicate breakpoint " + toString(breakpoint)};
    }

    auto owner = std::prev(m_Segments.upper_bound(breakpoint));
    const SSegment& segment{owner->second};

    std::size_t split{m_Dataset->lowerBound(breakpoint)};
    if (split < segment.s_Begin + m_MinimumSegmentSize ||
        split + m_MinimumSegmentSize > segment.s_End) {
        throw CInvalidBreakpointError{
            "Breakpoint " + toString(breakpoint) + " would split " +
            std::to_string(segment.size()) + " samples into " +
            std::to_string(split - segment.s_Begin) + " and " +
            std::to_string(segment.s_End - split) + ", minimum is " +
            std::to_string(m_MinimumSegmentSize)};
    }

    SSegment left;
    left.s_Begin = segment.s_Begin;
    left.s_End = split;
    left.s_Lower = segment.s_Lower;
    left.s_Upper = breakpoint;
    left.s_Depth = segment.s_Depth + 1;
    left.s_Fit = CSegmentFitter::fit(*m_Dataset, left.s_Begin, left.s_End);

    SSegment right;
    right.s_Begin = split;
    right.s_End = segment.s_End;
    right.s_Lower = breakpoint;
    right.s_Upper = segment.s_Upper;
    right.s_Depth = segment.s_Depth + 1;
    right.s_Fit = CSegmentFitter::fit(*m_Dataset, right.s_Begin, right.s_End);

    LOG_TRACE(<< "Split " << segment.print() << " into " << left.print()
              << " and " << right.print());

    // Only the emplace can fail so do it first.
    m_Segments.emplace_hint(std::next(owner), breakpoint, right);
    owner->second = left;
}

void CBreakpointTree::remove(double breakpoint) {
    auto i = m_Segments.find(breakpoint);
    if (i == m_Segments.end() || i == m_Segments.begin()) {
        throw CInvalidBreakpointError{"No breakpoint at " + toString(breakpoint)};
    }
    auto previous = std::prev(i);

    SSegment merged;
    merged.s_Begin = previous->second.s_Begin;
    merged.s_End = i->second.s_End;
    merged.s_Lower = previous->second.s_Lower;
    merged.s_Upper = i->second.s_Upper;
    std::size_t depth{std::min(previous->second.s_Depth, i->second.s_Depth)};
    merged.s_Depth = depth > 0 ? depth - 1 : 0;
    merged.s_Fit = CSegmentFitter::fit(*m_Dataset, merged.s_Begin, merged.s_End);

    LOG_TRACE(<< "Merged " << previous->second.print() << " and "
              << i->second.print() << " into " << merged.print());

    previous->second = merged;
    m_Segments.erase(i);
}

bool CBreakpointTree::contains(double breakpoint) const {
    auto i = m_Segments.find(breakpoint);
    return i != m_Segments.end() && i != m_Segments.begin();
}

CBreakpointTree::TDoubleVec CBreakpointTree::breakpoints() const {
    TDoubleVec result;
    result.reserve(m_Segments.size() - 1);
    for (auto i = std::next(m_Segments.begin()); i != m_Segments.end(); ++i) {
        result.push_back(i->first);
    }
    return result;
}

CBreakpointTree::TSegmentVec CBreakpointTree::segments() const {
    TSegmentVec result;
    result.reserve(m_Segments.size());
    for (const auto& segment : m_Segments) {
        result.push_back(segment.second);
    }
    return result;
}

const CBreakpointTree::SSegment& CBreakpointTree::segmentFor(double x) const {
    auto i = m_Segments.upper_bound(x);
    if (i == m_Segments.begin()) {
        return i->second;
    }
    return std::prev(i)->second;
}

double CBreakpointTree::rss() const {
    double result{0.0};
    for (const auto& segment : m_Segments) {
        result += segment.second.s_Fit.s_Rss;
    }
    return result;
}

double CBreakpointTree::computeRss() const {
    double result{0.0};
    for (const auto& segment : m_Segments) {
        const CSegmentFitter::SFit& fit{segment.second.s_Fit};
        for (std::size_t i = segment.second.s_Begin; i < segment.second.s_End; ++i) {
            double residual{m_Dataset->fy(i) - fit.predict(m_Dataset->fx(i))};
            result += m_Dataset->weight(i) * residual * residual;
        }
    }
    return result;
}

bool CBreakpointTree::checkInvariants() const {
    std::size_t begin{0};
    double lower{m_Dataset->minimumAbscissa()};
    for (const auto& entry : m_Segments) {
        const SSegment& segment{entry.second};
        if (entry.first != segment.s_Lower || segment.s_Lower != lower) {
            LOG_ERROR(<< "Gap or overlap at " << segment.print() << ", expected lower " << lower);
            return false;
        }
        if (segment.s_Begin != begin || segment.s_End <= segment.s_Begin) {
            LOG_ERROR(<< "Bad sample range " << segment.print() << ", expected begin " << begin);
            return false;
        }
        if (segment.s_Begin > 0 && segment.s_Begin != m_Dataset->lowerBound(segment.s_Lower)) {
            LOG_ERROR(<< "Samples " << segment.print() << " inconsistent with lower boundary");
            return false;
        }
        if (segment.s_Fit.s_Count != segment.size() ||
            m_Dataset->numberDistinctAbscissas(segment.s_Begin, segment.s_End) < 2) {
            LOG_ERROR(<< "Bad fit for " << segment.print());
            return false;
        }
        begin = segment.s_End;
        lower = segment.s_Upper;
    }
    if (begin != m_Dataset->size() || lower != m_Dataset->maximumAbscissa()) {
        LOG_ERROR(<< "Segments end at " << lower << " sample " << begin << " but data end at "
                  << m_Dataset->maximumAbscissa() << " sample " << m_Dataset->size());
        return false;
    }
    return true;
}

std::string CBreakpointTree::print() const {
    std::ostringstream result;
    result << "breakpoints = " << core::CContainerPrinter::print(this->breakpoints());
    for (const auto& segment : m_Segments) {
        result << "\n  " << segment.second.print();
    }
    return result.str();
}
}
}
