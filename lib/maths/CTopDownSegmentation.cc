/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CTopDownSegmentation.h>

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>
#include <core/Concurrency.h>

#include <maths/CSegmentFitter.h>
#include <maths/CSegmentationErrors.h>
#include <maths/CWeightedLinearRegression.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace segreg {
namespace maths {
namespace {
using TRegressionVec = std::vector<CWeightedLinearRegression>;

//! Check if \p lhs is a better candidate than \p rhs.
//!
//! Equal scores prefer the split nearer the segment midpoint then the
//! smaller breakpoint.
bool better(const CTopDownSegmentation::SCandidate& lhs,
            const CTopDownSegmentation::SCandidate& rhs) {
    if (rhs.s_Viable == false) {
        return lhs.s_Viable;
    }
    if (lhs.s_Viable == false) {
        return false;
    }
    if (CSegmentationScore::equivalent(lhs.s_Score, rhs.s_Score)) {
        if (lhs.s_Distance != rhs.s_Distance) {
            return lhs.s_Distance < rhs.s_Distance;
        }
        return lhs.s_Breakpoint < rhs.s_Breakpoint;
    }
    return lhs.s_Score < rhs.s_Score;
}
}

std::string CTopDownSegmentation::SCandidate::print() const {
    if (s_Viable == false) {
        return "none";
    }
    std::ostringstream result;
    result << "{breakpoint = " << s_Breakpoint << ", rss = " << s_Rss
           << ", score = " << s_Score << ", distance = " << s_Distance << "}";
    return result.str();
}

std::string CTopDownSegmentation::SSplitCurve::print() const {
    std::ostringstream result;
    result << "[" << s_Lower << ", " << s_Upper << "): no split = " << s_NoSplit
           << ", min split = " << s_MinSplit
           << ", splits = " << core::CContainerPrinter::print(s_Splits);
    return result.str();
}

CTopDownSegmentation::CTopDownSegmentation(TDatasetCPtr dataset,
                                           const CSegmentedRegressionParams& params)
    : m_Params{params}, m_Tree{std::move(dataset), params.minimumSegmentSize()},
      m_Scorer{m_Tree.dataset(), params.precision()} {
    m_Score = m_Scorer.score(m_Tree).value(m_Params.informationCriterion());
    m_History.push_back({0, m_Score});
    LOG_DEBUG(<< "Initial " << m_Params.informationCriterion() << " = " << m_Score);
}

bool CTopDownSegmentation::step() {
    if (m_State == E_Converged) {
        return false;
    }
    if (m_Tree.numberBreakpoints() >= m_Params.maximumBreakpoints()) {
        this->converge("reached maximum breakpoints");
        return false;
    }

    maths_t::EInfoCriterion criterion{m_Params.informationCriterion()};
    CBreakpointTree::TSegmentVec segments{m_Tree.segments()};

    std::vector<std::size_t> unsearched;
    bool splittable{false};
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (this->splittable(segments[i])) {
            splittable = true;
            if (m_Candidates.count(segments[i].s_Lower) == 0) {
                unsearched.push_back(i);
            }
        }
    }
    if (splittable == false) {
        this->converge("no segment can be split");
        return false;
    }

    std::vector<SCandidate> candidates(unsearched.size());
    TSplitCurveVec curves(unsearched.size());
    core::parallel_for_each(0, unsearched.size(), [&](std::size_t i) {
        candidates[i] = bestSplit(m_Tree, segments[unsearched[i]], m_Scorer,
                                  criterion, &curves[i]);
    });
    for (std::size_t i = 0; i < unsearched.size(); ++i) {
        LOG_TRACE(<< "Best split of " << segments[unsearched[i]].print() << " is "
                  << candidates[i].print());
        m_Candidates[segments[unsearched[i]].s_Lower] = candidates[i];
        m_Curves.push_back(std::move(curves[i]));
    }

    // The cached scores are relative to the tree when the segment was
    // searched so we recompute them for the current tree. A candidate which
    // fails to insert is marked non-viable and we try the next best.
    double rss{m_Tree.rss()};
    double rootMse{m_Scorer.rootMse(m_Tree)};
    std::size_t numberSegments{m_Tree.numberSegments() + 1};
    for (;;) {
        SCandidate best;
        double bestLower{0.0};
        for (const auto& segment : segments) {
            if (this->splittable(segment) == false) {
                continue;
            }
            SCandidate candidate{m_Candidates[segment.s_Lower]};
            if (candidate.s_Viable == false) {
                continue;
            }
            candidate.s_Score =
                m_Scorer
                    .score(rss - segment.s_Fit.s_Rss + candidate.s_Rss,
                           rootMse - m_Scorer.rootMse(segment.s_Fit.s_Rss, segment.size()) +
                               candidate.s_RootMse,
                           numberSegments)
                    .value(criterion);
            if (better(candidate, best)) {
                best = candidate;
                bestLower = segment.s_Lower;
            }
        }

        if (best.s_Viable == false) {
            this->converge("no viable split");
            return false;
        }
        if (CSegmentationScore::equivalent(best.s_Score, m_Score) ||
            m_Score - best.s_Score <= m_Params.minimumScoreImprovement()) {
            std::ostringstream reason;
            reason << "best split " << best.print() << " doesn't improve " << m_Score;
            this->converge(reason.str());
            return false;
        }

        try {
            m_Tree.insert(best.s_Breakpoint);
        } catch (const CSegmentationError& e) {
            LOG_DEBUG(<< "Failed to insert " << best.print() << ": " << e.what());
            m_Candidates[bestLower].s_Viable = false;
            continue;
        }

        m_Candidates.erase(bestLower);
        m_Score = m_Scorer.score(m_Tree).value(criterion);
        m_History.push_back({m_Tree.numberBreakpoints(), m_Score});
        LOG_DEBUG(<< "Inserted breakpoint " << best.s_Breakpoint << ", "
                  << m_Tree.numberBreakpoints() << " breakpoints, " << criterion
                  << " = " << m_Score);
        return true;
    }
}

void CTopDownSegmentation::build() {
    while (this->step()) {
    }
}

CTopDownSegmentation::SCandidate
CTopDownSegmentation::bestSplit(const CBreakpointTree& tree,
                                const CBreakpointTree::SSegment& segment,
                                const CSegmentationScore& scorer,
                                maths_t::EInfoCriterion criterion,
                                SSplitCurve* curve) {
    SCandidate result;

    if (curve != nullptr) {
        *curve = SSplitCurve{};
        curve->s_Lower = segment.s_Lower;
        curve->s_Upper = segment.s_Upper;
        curve->s_NoSplit = scorer.score(tree).value(criterion);
    }

    const CRegressionDataset& dataset{tree.dataset()};
    std::size_t minimumSize{tree.minimumSegmentSize()};
    std::size_t begin{segment.s_Begin};
    std::size_t end{segment.s_End};
    if (end - begin < 2 * minimumSize) {
        return result;
    }

    double otherRss{tree.rss() - segment.s_Fit.s_Rss};
    double otherRootMse{scorer.rootMse(tree) - scorer.rootMse(segment.s_Fit.s_Rss, segment.size())};
    std::size_t numberSegments{tree.numberSegments() + 1};

    double lowest{dataset.fx(begin)};
    double highest{dataset.fx(end - 1)};
    double midpoint{0.5 * (lowest + highest)};
    double halfWidth{0.5 * (highest - lowest)};
    if (halfWidth <= 0.0) {
        return result;
    }

    // suffix[i - begin] are the statistics of the samples [i, end).
    TRegressionVec suffix(end - begin + 1);
    for (std::size_t i = end; i > begin; --i) {
        suffix[i - 1 - begin] = suffix[i - begin];
        suffix[i - 1 - begin].add(dataset.fx(i - 1), dataset.fy(i - 1), dataset.weight(i - 1));
    }

    const CCoordinateTransform& transform{dataset.transform()};

    CWeightedLinearRegression prefix;
    for (std::size_t i = begin; i < end; ++i) {
        if (i > begin && dataset.isGroupStart(i) && i - begin >= minimumSize &&
            end - i >= minimumSize && dataset.numberDistinctAbscissas(begin, i) >= 2 &&
            dataset.numberDistinctAbscissas(i, end) >= 2) {

            CSegmentFitter::SFit left;
            CSegmentFitter::SFit right;
            if (CSegmentFitter::tryFit(prefix, left) &&
                CSegmentFitter::tryFit(suffix[i - begin], right)) {
                SCandidate candidate;
                candidate.s_Viable = true;
                candidate.s_Rss = left.s_Rss + right.s_Rss;
                candidate.s_RootMse = scorer.rootMse(left.s_Rss, i - begin) +
                                      scorer.rootMse(right.s_Rss, end - i);
                candidate.s_Score = scorer
                                        .score(otherRss + candidate.s_Rss,
                                               otherRootMse + candidate.s_RootMse, numberSegments)
                                        .value(criterion);

                double split{0.5 * (dataset.fx(i - 1) + dataset.fx(i))};
                candidate.s_Breakpoint = transform.inverseAbscissa(split);
                if (!(candidate.s_Breakpoint > dataset.x(i - 1) &&
                      candidate.s_Breakpoint <= dataset.x(i))) {
                    candidate.s_Breakpoint = dataset.x(i);
                }
                candidate.s_Distance = std::fabs(split - midpoint) / halfWidth;

                if (curve != nullptr) {
                    curve->s_Splits.emplace_back(candidate.s_Breakpoint, candidate.s_Score);
                    curve->s_MinSplit = std::min(curve->s_MinSplit, candidate.s_Score);
                }

                if (better(candidate, result)) {
                    result = candidate;
                }
            } else {
                LOG_TRACE(<< "Excluding split at sample " << i << ": ill-conditioned fit");
            }
        }
        prefix.add(dataset.fx(i), dataset.fy(i), dataset.weight(i));
    }

    return result;
}

bool CTopDownSegmentation::splittable(const CBreakpointTree::SSegment& segment) const {
    return segment.s_Depth < m_Params.maximumDepth() &&
           segment.size() >= 2 * m_Tree.minimumSegmentSize() &&
           m_Tree.dataset().numberDistinctAbscissas(segment.s_Begin, segment.s_End) >= 4;
}

void CTopDownSegmentation::converge(const std::string& reason) {
    m_State = E_Converged;
    LOG_DEBUG(<< "Converged with " << m_Tree.numberBreakpoints()
              << " breakpoints: " << reason);
}
}
}
