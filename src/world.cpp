#include "world.h"

std::string describe(const Verdict& verdict) {
    switch (verdict.progress) {
        case Progress::Running: return "running";
        case Progress::Win:     return "win";
        case Progress::Abort:   return "abort";
        case Progress::Restart: return "restart";
        case Progress::Skip:    return "skip";
        case Progress::Loss:
            switch (verdict.reason) {
                case LossReason::CrushedByRock: return "loss (crushed by rock)";
                case LossReason::Drowned:       return "loss (drowned)";
                case LossReason::None:          break;
            }
            return "loss";
    }
    return "unknown";
}
