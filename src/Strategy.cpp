#include "jellyfin_backup/Strategy.hpp"

namespace jfbak {

	const char* toString(StrategyOutcome o) {
		switch (o)
		{
		case StrategyOutcome::Succeeded: return "succeeded";
		case StrategyOutcome::NotApplicable: return "not applicable";
		case StrategyOutcome::Failed: return "failed";
		}
		return "unknown";
	}

};//---namespace jfbak
