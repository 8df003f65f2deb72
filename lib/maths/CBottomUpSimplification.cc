/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CBottomUpSimplification.h>

#include <core/CLogger.h>
#include <core/Concurrency.h>

#include <maths/CSegmentFitter.h>
#include <maths/CSegmentationErrors.h>

namespace segreg {
namespace maths {
namespace {
//! \brief The score of removing a breakpoint.
struct SRemoval {
    bool s_Viable{false};
    double s_Breakpoint{0.0};
    double s_Score{0.0};
};
}

CBreakpointTree CBottomUpSimplification::simplify(const CBreakpointTree& tree,
                                                  const CSegmentationScore& scorer,
                                                  maths_t::EInfoCriterion criterion) {
    if (tree.numberBreakpoints() == 0) {
        throw CNoBreakpointsError{"Can't simplify a single segment"};
    }

    CBreakpointTree::TSegmentVec segments{tree.segments()};
    double rss{tree.rss()};
    double rootMse{scorer.rootMse(tree)};
    std::size_t numberSegments{tree.numberSegments() - 1};

    // removals[i] is the removal of the lower boundary of segment i + 1.
    std::vector<SRemoval> removals(segments.size() - 1);
    core::parallel_for_each(0, removals.size(), [&](std::size_t i) {
        const auto& left = segments[i];
        const auto& right = segments[i + 1];
        CSegmentFitter::SFit merged;
        if (CSegmentFitter::tryFit(left.s_Fit.s_Regression + right.s_Fit.s_Regression, merged)) {
            double mergedRss{rss - left.s_Fit.s_Rss - right.s_Fit.s_Rss + merged.s_Rss};
            double mergedRootMse{rootMse - scorer.rootMse(left.s_Fit.s_Rss, left.size()) -
                                 scorer.rootMse(right.s_Fit.s_Rss, right.size()) +
                                 scorer.rootMse(merged.s_Rss, left.size() + right.size())};
            removals[i].s_Viable = true;
            removals[i].s_Breakpoint = right.s_Lower;
            removals[i].s_Score =
                scorer.score(mergedRss, mergedRootMse, numberSegments).value(criterion);
        } else {
            LOG_TRACE(<< "Excluding removal of " << right.s_Lower << ": ill-conditioned fit");
        }
    });

    // Removals are in increasing breakpoint order so keeping the first of
    // equal scores prefers the smaller breakpoint.
    const SRemoval* best{nullptr};
    for (const auto& removal : removals) {
        if (removal.s_Viable &&
            (best == nullptr ||
             (removal.s_Score < best->s_Score &&
              CSegmentationScore::equivalent(removal.s_Score, best->s_Score) == false))) {
            best = &removal;
        }
    }
    if (best == nullptr) {
        throw CNoBreakpointsError{"No breakpoint can be removed"};
    }

    LOG_DEBUG(<< "Removing breakpoint " << best->s_Breakpoint << ", " << criterion
              << " = " << best->s_Score);

    CBreakpointTree result{tree};
    result.remove(best->s_Breakpoint);
    return result;
}

CBottomUpSimplification::TStepVec
CBottomUpSimplification::trajectory(const CBreakpointTree& tree,
                                    const CSegmentationScore& scorer,
                                    maths_t::EInfoCriterion criterion) {
    TStepVec result;
    result.reserve(tree.numberSegments());
    result.emplace_back(tree, scorer.score(tree));

    while (result.back().s_Tree.numberBreakpoints() > 0) {
        try {
            CBreakpointTree simplified{simplify(result.back().s_Tree, scorer, criterion)};
            CSegmentationScore::SScore score{scorer.score(simplified)};
            result.emplace_back(std::move(simplified), score);
        } catch (const CNoBreakpointsError& e) {
            LOG_DEBUG(<< "Stopped simplifying at " << result.back().s_Tree.numberBreakpoints()
                      << " breakpoints: " << e.what());
            break;
        }
    }

    return result;
}

CBreakpointTree CBottomUpSimplification::autoSimplify(const CBreakpointTree& tree,
                                                      const CSegmentationScore& scorer,
                                                      maths_t::EInfoCriterion criterion) {
    TStepVec steps{trajectory(tree, scorer, criterion)};

    // Later steps have fewer breakpoints so they win ties.
    std::size_t best{0};
    for (std::size_t i = 1; i < steps.size(); ++i) {
        double score{steps[i].s_Score.value(criterion)};
        double bestScore{steps[best].s_Score.value(criterion)};
        if (score < bestScore || CSegmentationScore::equivalent(score, bestScore)) {
            best = i;
        }
    }

    LOG_DEBUG(<< "Selected " << steps[best].s_Tree.numberBreakpoints() << " of "
              << tree.numberBreakpoints() << " breakpoints, " << criterion << " = "
              << steps[best].s_Score.value(criterion));

    return std::move(steps[best].s_Tree);
}
}
}
