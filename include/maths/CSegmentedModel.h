/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CSegmentedModel_h
#define INCLUDED_segreg_maths_CSegmentedModel_h

#include <maths/CBreakpointTree.h>
#include <maths/CSegmentationScore.h>
#include <maths/CSegmentedRegressionParams.h>
#include <maths/CTopDownSegmentation.h>
#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace segreg {
namespace maths {

//! \brief A fitted segmented regression model.
//!
//! DESCRIPTION:\n
//! Wraps a segmentation together with the parameters used to fit it and
//! exposes its breakpoints, per segment fits and scores. Simplification
//! returns a new model and leaves this one unchanged.
class MATHS_EXPORT CSegmentedModel {
public:
    using TDoubleVec = maths_t::TDoubleVec;
    using TGrowthStepVec = CTopDownSegmentation::TGrowthStepVec;
    using TSplitCurveVec = CTopDownSegmentation::TSplitCurveVec;

    //! \brief A row of the segment table.
    struct MATHS_EXPORT SRow {
        double s_Lower{0.0};
        double s_Upper{0.0};
        double s_Slope{0.0};
        double s_Intercept{0.0};
        double s_Rss{0.0};
        std::size_t s_Count{0};
    };
    using TRowVec = std::vector<SRow>;

public:
    CSegmentedModel(CBreakpointTree tree,
                    const CSegmentedRegressionParams& params,
                    TGrowthStepVec history = TGrowthStepVec{},
                    TSplitCurveVec curves = TSplitCurveVec{});

    //! Get the breakpoints in increasing order.
    TDoubleVec breakpoints() const;

    std::size_t numberBreakpoints() const { return m_Tree.numberBreakpoints(); }
    std::size_t numberSegments() const { return m_Tree.numberSegments(); }

    //! Get the segments in increasing order.
    //!
    //! The slope and intercept are in fitting coordinates.
    TRowVec table() const;

    //! Get the score of the model.
    const CSegmentationScore::SScore& score() const { return m_Score; }

    //! Get the value of the configured information criterion.
    double criterionValue() const;

    double bic() const { return m_Score.s_Bic; }
    double aic() const { return m_Score.s_Aic; }
    double logLikelihood() const { return m_Score.s_LogLikelihood; }

    //! Get the weighted residual sum of squares of the segment fits.
    double rss() const { return m_Tree.rss(); }

    //! Recompute the weighted residual sum of squares from the samples.
    double computeRss() const { return m_Tree.computeRss(); }

    //! Get the unweighted mean squared error in fitting coordinates.
    double meanSquaredError() const;

    //! Predict the ordinate at \p x in the original coordinates.
    //!
    //! \throws CDegenerateSegmentError if \p x is outside the domain of the
    //! coordinate transform.
    double predict(double x) const;

    //! Get the top-down growth history of the model.
    //!
    //! This is empty for simplified models.
    const TGrowthStepVec& history() const { return m_History; }

    //! Get the split curves of the segments searched while growing the
    //! model.
    //!
    //! This is empty for simplified models.
    const TSplitCurveVec& curves() const { return m_Curves; }

    //! Get the model with the breakpoint whose removal gives the best score
    //! removed.
    //!
    //! \throws CNoBreakpointsError if there are no breakpoints.
    CSegmentedModel simplify() const;

    //! Get the simplification of this model with the best score.
    CSegmentedModel autoSimplify() const;

    maths_t::ERegressionMode mode() const;
    const CBreakpointTree& tree() const { return m_Tree; }
    const CSegmentedRegressionParams& params() const { return m_Params; }

    std::string print() const;

private:
    CBreakpointTree m_Tree;
    CSegmentedRegressionParams m_Params;
    CSegmentationScore m_Scorer;
    CSegmentationScore::SScore m_Score;
    TGrowthStepVec m_History;
    TSplitCurveVec m_Curves;
};

MATHS_EXPORT
std::ostream& operator<<(std::ostream& strm, const CSegmentedModel& model);
}
}

#endif // INCLUDED_segreg_maths_CSegmentedModel_h
