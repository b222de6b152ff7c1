//
// Created by gregorian-rayne on 2/11/26.
//

#include "cca/analyzers/all_analyzers.hpp"

namespace cca::analyzers
{
    AnalyzerPtr make_analyzer(const Category category, storage::StorePtr store) {
        switch (category) {
            case Category::Security:
                return std::make_unique<SecurityAnalyzer>(std::move(store));
            case Category::Quality:
                return std::make_unique<QualityAnalyzer>(std::move(store));
            case Category::Performance:
                return std::make_unique<PerformanceAnalyzer>(std::move(store));
            case Category::BestPractices:
                return std::make_unique<BestPracticesAnalyzer>(std::move(store));
        }
        return nullptr;
    }

}  // namespace cca::analyzers
