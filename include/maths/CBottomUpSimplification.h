/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CBottomUpSimplification_h
#define INCLUDED_segreg_maths_CBottomUpSimplification_h

#include <maths/CBreakpointTree.h>
#include <maths/CSegmentationScore.h>
#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <cstddef>
#include <vector>

namespace segreg {
namespace maths {

//! \brief Greedily removes breakpoints from a segmentation.
//!
//! DESCRIPTION:\n
//! A simplification step removes the breakpoint whose removal gives the
//! lowest information criterion value. Repeating this down to a single
//! segment gives a trajectory of nested segmentations from which the one
//! with the lowest criterion value is selected.
//!
//! The residual sum of squares of each merge is computed by combining the
//! regression statistics of the two adjacent segments so evaluating all
//! removals is linear in the number of breakpoints.
class MATHS_EXPORT CBottomUpSimplification {
public:
    //! \brief A segmentation on the simplification trajectory.
    struct MATHS_EXPORT SStep {
        SStep(CBreakpointTree tree, CSegmentationScore::SScore score)
            : s_Tree{std::move(tree)}, s_Score{score} {}

        CBreakpointTree s_Tree;
        CSegmentationScore::SScore s_Score;
    };
    using TStepVec = std::vector<SStep>;

public:
    //! Remove the single breakpoint which gives the best score.
    //!
    //! Equal scores prefer removing the smaller breakpoint.
    //! \throws CNoBreakpointsError if \p tree has no breakpoints or none
    //! can be removed.
    static CBreakpointTree simplify(const CBreakpointTree& tree,
                                    const CSegmentationScore& scorer,
                                    maths_t::EInfoCriterion criterion);

    //! Get the segmentations found by repeatedly simplifying \p tree.
    //!
    //! The first step is \p tree and the number of breakpoints decreases by
    //! one each step.
    static TStepVec trajectory(const CBreakpointTree& tree,
                               const CSegmentationScore& scorer,
                               maths_t::EInfoCriterion criterion);

    //! Get the segmentation on the trajectory of \p tree with the lowest
    //! score.
    //!
    //! Equal scores prefer fewer breakpoints.
    static CBreakpointTree autoSimplify(const CBreakpointTree& tree,
                                        const CSegmentationScore& scorer,
                                        maths_t::EInfoCriterion criterion);
};
}
}

#endif // INCLUDED_segreg_maths_CBottomUpSimplification_h
