#include <iostream>
#include "jellyfin_backup/App.hpp"
#include "jellyfin_backup/Cli.hpp"

int main(int argc, char** argv) {

	//---Разбор аргументов командной строки
	const jfbak::CliOptions opt = jfbak::parseCli(argc, argv);

	//---Если запрошена справка или команда некорректна → вывод справки и выход
	if (opt.cmd == jfbak::Command::Help || opt.cmd == jfbak::Command::Invalid)
	{
		jfbak::printHelp(std::cout);
		return (opt.cmd == jfbak::Command::Invalid) ? 2 : 0;
	}

	return jfbak::runApp(opt, argv[0]);
}
