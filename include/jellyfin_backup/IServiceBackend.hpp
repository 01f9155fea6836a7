#pragma once
#include <string>

namespace jfbak {

	//---Интерфейс управляемой службы ОС (Windows SCM / systemd)
	class IServiceBackend {
	public:
		virtual ~IServiceBackend() = default;

		//---Зарегистрирована ли служба. false - если проверить не удалось
		virtual bool exists(const std::string& name, bool& exists, std::string* error) = 0;

		virtual bool start(const std::string& name, std::string* error) = 0;
		virtual bool stop(const std::string& name, std::string* error) = 0;
	};
};//---namespace jfbak
