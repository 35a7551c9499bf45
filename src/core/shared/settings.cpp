#include "core/shared/settings.h"

namespace ci {

QVector<FeatureWeightDefault> defaultFeatureWeights()
{
    return {
        {QStringLiteral("semantic"),   0.30, 0.8},
        {QStringLiteral("graph"),      0.20, 0.7},
        {QStringLiteral("contextual"), 0.15, 0.6},
        {QStringLiteral("recency"),    0.10, 0.5},
        {QStringLiteral("popularity"), 0.10, 0.5},
        {QStringLiteral("original"),   0.15, 0.9},
    };
}

} // namespace ci
