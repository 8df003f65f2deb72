/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CTopDownSegmentation_h
#define INCLUDED_segreg_maths_CTopDownSegmentation_h

#include <maths/CBreakpointTree.h>
#include <maths/CRegressionDataset.h>
#include <maths/CSegmentationScore.h>
#include <maths/CSegmentedRegressionParams.h>
#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace segreg {
namespace maths {

//! \brief Grows a segmentation by greedily inserting breakpoints.
//!
//! DESCRIPTION:\n
//! Starting from a single segment, each step finds the best split of every
//! segment and commits the one which most reduces the information
//! criterion of the whole segmentation. This continues until no split
//! improves the criterion by more than the minimum improvement or a limit
//! on the number of breakpoints or the depth is reached.
//!
//! Candidate splits are the boundaries between groups of samples with
//! distinct abscissas. The breakpoint is placed midway between the two
//! groups in fitting coordinates. All candidates for a segment are scored
//! in one pass using prefix and suffix regression statistics.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The best split of a segment only depends on its samples so it is cached
//! until the segment is split. The segments without a cached split are
//! searched in parallel with core::parallel_for_each. Each search reads the
//! current tree and writes its own result so the outcome doesn't depend on
//! the number of threads.
//!
//! The score of every candidate split of every searched segment is kept as
//! a split curve. This shows how sharply the criterion picks out each
//! breakpoint.
class MATHS_EXPORT CTopDownSegmentation {
public:
    //! The state of the search.
    enum EState { E_Growing, E_Converged };

    //! \brief The best split of a segment.
    struct MATHS_EXPORT SCandidate {
        std::string print() const;

        bool s_Viable{false};
        double s_Breakpoint{0.0};
        //! The residual sum of squares of the two halves.
        double s_Rss{0.0};
        //! The size weighted root mean square residual of the two halves.
        double s_RootMse{0.0};
        //! The criterion value of the segmentation with the split.
        double s_Score{0.0};
        //! The distance of the split from the segment midpoint as a
        //! fraction of its half width in fitting coordinates.
        double s_Distance{0.0};
    };

    //! \brief A record of a committed step.
    struct MATHS_EXPORT SGrowthStep {
        std::size_t s_NumberBreakpoints{0};
        double s_Score{0.0};
    };
    using TGrowthStepVec = std::vector<SGrowthStep>;

    //! \brief The scores of the candidate splits of a segment.
    //!
    //! Scores are criterion values of the whole segmentation when the
    //! segment was searched.
    struct MATHS_EXPORT SSplitCurve {
        std::string print() const;

        //! The boundaries of the segment.
        double s_Lower{0.0};
        double s_Upper{0.0};
        //! The score without the split.
        double s_NoSplit{0.0};
        //! The breakpoint and score of each candidate in increasing
        //! breakpoint order.
        maths_t::TDoubleDoublePrVec s_Splits;
        //! The lowest candidate score or infinity if there are none.
        double s_MinSplit{std::numeric_limits<double>::infinity()};
    };
    using TSplitCurveVec = std::vector<SSplitCurve>;

public:
    //! \throws CDegenerateSegmentError if \p dataset can't be fitted.
    CTopDownSegmentation(TDatasetCPtr dataset, const CSegmentedRegressionParams& params);

    EState state() const { return m_State; }

    //! Try to insert one breakpoint.
    //!
    //! \return True if a breakpoint was inserted.
    bool step();

    //! Run until converged.
    void build();

    const CBreakpointTree& tree() const { return m_Tree; }

    //! Get the criterion value of the current segmentation.
    double score() const { return m_Score; }

    //! Get the history of committed steps, including the initial segment.
    const TGrowthStepVec& history() const { return m_History; }

    //! Get the split curves of the searched segments in search order.
    const TSplitCurveVec& curves() const { return m_Curves; }

    //! Find the best split of \p segment of \p tree.
    //!
    //! The score of a split is the criterion value of \p tree with
    //! \p segment split. If \p curve is supplied it is filled in with the
    //! score of every candidate.
    static SCandidate bestSplit(const CBreakpointTree& tree,
                                const CBreakpointTree::SSegment& segment,
                                const CSegmentationScore& scorer,
                                maths_t::EInfoCriterion criterion,
                                SSplitCurve* curve = nullptr);

private:
    using TDoubleCandidateMap = std::map<double, SCandidate>;

private:
    //! Check if \p segment may be split.
    bool splittable(const CBreakpointTree::SSegment& segment) const;

    //! Stop growing.
    void converge(const std::string& reason);

private:
    CSegmentedRegressionParams m_Params;
    CBreakpointTree m_Tree;
    CSegmentationScore m_Scorer;
    EState m_State{E_Growing};
    double m_Score{0.0};
    //! The best split of each segment by lower boundary.
    TDoubleCandidateMap m_Candidates;
    TGrowthStepVec m_History;
    TSplitCurveVec m_Curves;
};
}
}

#endif // INCLUDED_segreg_maths_CTopDownSegmentation_h
