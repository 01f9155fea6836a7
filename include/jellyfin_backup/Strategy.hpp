#pragma once

namespace jfbak {

	//---Результат одной стратегии в цепочке запасных вариантов
	enum class StrategyOutcome {
		Succeeded,
		NotApplicable,		//	Стратегия не применима (нет службы / нет утилиты / нет процесса)
		Failed
	};

	const char* toString(StrategyOutcome o);

};//---namespace jfbak
