/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CSegmentedModel.h>

#include <core/CContainerPrinter.h>
#include <core/CStringUtils.h>

#include <maths/CBasicStatistics.h>
#include <maths/CBottomUpSimplification.h>

#include <ostream>
#include <sstream>

namespace segreg {
namespace maths {

CSegmentedModel::CSegmentedModel(CBreakpointTree tree,
                                 const CSegmentedRegressionParams& params,
                                 TGrowthStepVec history,
                                 TSplitCurveVec curves)
    : m_Tree{std::move(tree)}, m_Params{params},
      m_Scorer{m_Tree.dataset(), params.precision()},
      m_Score{m_Scorer.score(m_Tree)},
      m_History{std::move(history)}, m_Curves{std::move(curves)} {
}

CSegmentedModel::TDoubleVec CSegmentedModel::breakpoints() const {
    return m_Tree.breakpoints();
}

CSegmentedModel::TRowVec CSegmentedModel::table() const {
    TRowVec result;
    for (const auto& segment : m_Tree.segments()) {
        SRow row;
        row.s_Lower = segment.s_Lower;
        row.s_Upper = segment.s_Upper;
        row.s_Slope = segment.s_Fit.s_Slope;
        row.s_Intercept = segment.s_Fit.s_Intercept;
        row.s_Rss = segment.s_Fit.s_Rss;
        row.s_Count = segment.s_Fit.s_Count;
        result.push_back(row);
    }
    return result;
}

double CSegmentedModel::criterionValue() const {
    return m_Score.value(m_Params.informationCriterion());
}

double CSegmentedModel::meanSquaredError() const {
    const CRegressionDataset& dataset{m_Tree.dataset()};
    CBasicStatistics::SSampleMean result;
    for (const auto& segment : m_Tree.segments()) {
        for (std::size_t i = segment.s_Begin; i < segment.s_End; ++i) {
            double residual{dataset.fy(i) - segment.s_Fit.predict(dataset.fx(i))};
            result.add(residual * residual);
        }
    }
    return CBasicStatistics::mean(result);
}

double CSegmentedModel::predict(double x) const {
    const CCoordinateTransform& transform{m_Tree.dataset().transform()};
    double fx{transform.transformAbscissa(x)};
    return transform.inverseOrdinate(m_Tree.segmentFor(x).s_Fit.predict(fx));
}

CSegmentedModel CSegmentedModel::simplify() const {
    return {CBottomUpSimplification::simplify(m_Tree, m_Scorer, m_Params.informationCriterion()),
            m_Params};
}

CSegmentedModel CSegmentedModel::autoSimplify() const {
    return {CBottomUpSimplification::autoSimplify(m_Tree, m_Scorer,
                                                  m_Params.informationCriterion()),
            m_Params};
}

maths_t::ERegressionMode CSegmentedModel::mode() const {
    return m_Tree.dataset().transform().mode();
}

std::string CSegmentedModel::print() const {
    const CCoordinateTransform& transform{m_Tree.dataset().transform()};
    std::ostringstream result;
    result << "mode = " << transform.print() << ", "
           << m_Params.informationCriterion() << " = " << this->criterionValue()
           << ", breakpoints = " << core::CContainerPrinter::print(this->breakpoints());
    for (const auto& row : this->table()) {
        result << "\n  [" << core::CStringUtils::typeToStringPretty(row.s_Lower) << ", "
               << core::CStringUtils::typeToStringPretty(row.s_Upper) << "): "
               << transform.ordinateLabel() << " = "
               << core::CStringUtils::typeToStringPretty(row.s_Slope) << " "
               << transform.abscissaLabel() << " + "
               << core::CStringUtils::typeToStringPretty(row.s_Intercept)
               << ", rss = " << core::CStringUtils::typeToStringPretty(row.s_Rss)
               << ", n = " << row.s_Count;
    }
    return result.str();
}

std::ostream& operator<<(std::ostream& strm, const CSegmentedModel& model) {
    return strm << model.print();
}
}
}
