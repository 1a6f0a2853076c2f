#include "MixerControl/MixerClient.h"
#include "MixerControl/MixerConfig.h"
#include "MixerControl/MixerExceptions.h"

#include <any>
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using MixerControl::MixerClient;
using MixerControl::MixerConfig;
using MixerControl::OscArgs;

// Global shutdown flag for signal handling
std::atomic<bool> g_shutdown_requested(false);

void signal_handler(int signum)
{
	std::cout << "\nShutdown requested (Signal " << signum << ")...\n";
	g_shutdown_requested.store(true);
}

namespace
{
	using Command = std::function<void(const std::vector<std::string> &)>;

	/**
	 * @brief Turn a console token into an OSC argument (int, float or string)
	 */
	std::any parseArgToken(const std::string &token)
	{
		size_t consumed = 0;
		try
		{
			if (token.find_first_of(".eE") == std::string::npos)
			{
				int i = std::stoi(token, &consumed);
				if (consumed == token.size())
					return std::any(i);
			}
			float f = std::stof(token, &consumed);
			if (consumed == token.size())
				return std::any(f);
		}
		catch (const std::exception &)
		{
			// Not a number: sent as a string
		}
		return std::any(token);
	}

	bool parseOnOff(const std::string &token)
	{
		if (token == "on" || token == "1" || token == "true")
			return true;
		if (token == "off" || token == "0" || token == "false")
			return false;
		throw std::invalid_argument("expected on|off, got " + token);
	}

	std::string joinFrom(const std::vector<std::string> &args, size_t first)
	{
		std::string text;
		for (size_t i = first; i < args.size(); ++i)
		{
			if (i > first)
				text += " ";
			text += args[i];
		}
		return text;
	}

	void printUsage()
	{
		std::cout << "Usage: mixer_osc_cli [options]\n"
				  << "  --config <file>   JSON configuration file\n"
				  << "  --host, -i <host> Mixer address (env OSC_HOST)\n"
				  << "  --port, -p <port> Mixer OSC port (env OSC_PORT)\n"
				  << "  --timeout <ms>    Query timeout\n"
				  << "  --verbose, -v     Print lifecycle messages\n"
				  << "  --daemon          Only hold the subscription open until interrupted\n"
				  << "  --help, -h        Show this help\n";
	}

	void printHelp()
	{
		std::cout << "Available commands:\n"
				  << "  help                          - Show this help\n"
				  << "  quit                          - Exit the application\n"
				  << "  status                        - Probe the mixer and print the session state\n"
				  << "  fader <ch> [level]            - Get or set a channel fader (0.0-1.0)\n"
				  << "  mute <ch> [on|off]            - Get or set a channel mute\n"
				  << "  pan <ch> [value]              - Get or set a channel pan (-1.0-1.0)\n"
				  << "  name <ch> [text]              - Get or set a channel name\n"
				  << "  eq <ch> <band> [gain_db]      - Get or set an EQ band gain\n"
				  << "  bus <n> [level]               - Get or set a bus fader\n"
				  << "  main [level]                  - Get or set the main fader\n"
				  << "  scene recall <n>              - Load a scene\n"
				  << "  scene save <n> [name]         - Store the current mix into a scene\n"
				  << "  scene name <n>                - Get a scene's name\n"
				  << "  scene current                 - Get the loaded scene\n"
				  << "  send <address> [args...]      - Send a raw OSC message\n"
				  << "  query <address> [args...]     - Query a raw OSC address\n";
	}

	std::map<std::string, Command> buildCommands(MixerClient &client)
	{
		std::map<std::string, Command> commands;

		commands["status"] = [&client](const std::vector<std::string> &)
		{
			std::cout << client.status().toJson().dump(2) << std::endl;
		};

		commands["fader"] = [&client](const std::vector<std::string> &args)
		{
			if (args.empty())
			{
				std::cout << "Usage: fader <ch> [level]\n";
				return;
			}
			int channel = std::stoi(args[0]);
			if (args.size() > 1)
			{
				client.setChannelFader(channel, std::stof(args[1]));
				std::cout << "Channel " << channel << " fader set to " << args[1] << "\n";
			}
			else
			{
				std::cout << "Channel " << channel << " fader: " << client.getChannelFader(channel) << "\n";
			}
		};

		commands["mute"] = [&client](const std::vector<std::string> &args)
		{
			if (args.empty())
			{
				std::cout << "Usage: mute <ch> [on|off]\n";
				return;
			}
			int channel = std::stoi(args[0]);
			if (args.size() > 1)
			{
				bool mute = parseOnOff(args[1]);
				client.setChannelMute(channel, mute);
				std::cout << "Channel " << channel << (mute ? " muted" : " unmuted") << std::endl;
			}
			else
			{
				std::cout << "Channel " << channel << (client.getChannelMute(channel) ? " is muted" : " is not muted") << "\n";
			}
		};

		commands["pan"] = [&client](const std::vector<std::string> &args)
		{
			if (args.empty())
			{
				std::cout << "Usage: pan <ch> [value]\n";
				return;
			}
			int channel = std::stoi(args[0]);
			if (args.size() > 1)
			{
				client.setChannelPan(channel, std::stof(args[1]));
				std::cout << "Channel " << channel << " pan set to " << args[1] << "\n";
			}
			else
			{
				std::cout << "Channel " << channel << " pan: " << client.getChannelPan(channel) << "\n";
			}
		};

		commands["name"] = [&client](const std::vector<std::string> &args)
		{
			if (args.empty())
			{
				std::cout << "Usage: name <ch> [text]\n";
				return;
			}
			int channel = std::stoi(args[0]);
			if (args.size() > 1)
			{
				std::string name = joinFrom(args, 1);
				client.setChannelName(channel, name);
				std::cout << "Channel " << channel << " renamed to \"" << name << "\"\n";
			}
			else
			{
				std::cout << "Channel " << channel << " name: \"" << client.getChannelName(channel) << "\"\n";
			}
		};

		commands["eq"] = [&client](const std::vector<std::string> &args)
		{
			if (args.size() < 2)
			{
				std::cout << "Usage: eq <ch> <band> [gain_db]\n";
				return;
			}
			int channel = std::stoi(args[0]);
			int band = std::stoi(args[1]);
			if (args.size() > 2)
			{
				client.setEqGain(channel, band, std::stof(args[2]));
				std::cout << "Channel " << channel << " EQ band " << band << " gain set to " << args[2] << " dB\n";
			}
			else
			{
				std::cout << "Channel " << channel << " EQ band " << band << " gain: "
						  << client.getEqGain(channel, band) << " dB\n";
			}
		};

		commands["bus"] = [&client](const std::vector<std::string> &args)
		{
			if (args.empty())
			{
				std::cout << "Usage: bus <n> [level]\n";
				return;
			}
			int bus = std::stoi(args[0]);
			if (args.size() > 1)
			{
				client.setBusFader(bus, std::stof(args[1]));
				std::cout << "Bus " << bus << " fader set to " << args[1] << "\n";
			}
			else
			{
				std::cout << "Bus " << bus << " fader: " << client.getBusFader(bus) << "\n";
			}
		};

		commands["main"] = [&client](const std::vector<std::string> &args)
		{
			if (!args.empty())
			{
				client.setMainFader(std::stof(args[0]));
				std::cout << "Main fader set to " << args[0] << "\n";
			}
			else
			{
				std::cout << "Main fader: " << client.getMainFader() << "\n";
			}
		};

		commands["scene"] = [&client](const std::vector<std::string> &args)
		{
			if (args.empty())
			{
				std::cout << "Usage: scene recall|save|name|current ...\n";
				return;
			}
			const std::string &action = args[0];
			if (action == "current")
			{
				int scene = client.getCurrentScene();
				if (scene > 0)
					std::cout << "Current scene: " << scene << "\n";
				else
					std::cout << "No scene loaded\n";
				return;
			}
			if (args.size() < 2)
			{
				std::cout << "Usage: scene " << action << " <n>\n";
				return;
			}
			int scene = std::stoi(args[1]);
			if (action == "recall")
			{
				client.recallScene(scene);
				std::cout << "Scene " << scene << " recalled\n";
			}
			else if (action == "save")
			{
				client.saveScene(scene, joinFrom(args, 2));
				std::cout << "Scene " << scene << " saved\n";
			}
			else if (action == "name")
			{
				std::cout << "Scene " << scene << " name: \"" << client.getSceneName(scene) << "\"\n";
			}
			else
			{
				std::cout << "Unknown scene action: " << action << "\n";
			}
		};

		commands["send"] = [&client](const std::vector<std::string> &args)
		{
			if (args.empty())
			{
				std::cout << "Usage: send <address> [args...]\n";
				return;
			}
			OscArgs oscArgs;
			for (size_t i = 1; i < args.size(); ++i)
			{
				oscArgs.push_back(parseArgToken(args[i]));
			}
			client.sendCustom(args[0], oscArgs);
			std::cout << "Sent " << args[0] << "\n";
		};

		commands["query"] = [&client](const std::vector<std::string> &args)
		{
			if (args.empty())
			{
				std::cout << "Usage: query <address> [args...]\n";
				return;
			}
			OscArgs oscArgs;
			for (size_t i = 1; i < args.size(); ++i)
			{
				oscArgs.push_back(parseArgToken(args[i]));
			}
			std::any reply = client.queryCustom(args[0], oscArgs);
			std::cout << args[0] << " = " << MixerControl::formatArg(reply) << "\n";
		};

		return commands;
	}

	void runConsole(MixerClient &client)
	{
		std::map<std::string, Command> commands = buildCommands(client);

		std::cout << "Interactive console ready. Type 'help' for commands.\n";
		std::string input;
		while (!g_shutdown_requested.load())
		{
			std::cout << "> ";
			if (!std::getline(std::cin, input))
				break;

			if (input.empty())
				continue;

			// Parse input into command and arguments
			std::vector<std::string> tokens;
			std::stringstream ss(input);
			std::string token;
			while (ss >> token)
			{
				tokens.push_back(token);
			}

			if (tokens.empty())
				continue;

			std::string cmd = tokens[0];
			std::vector<std::string> args(tokens.begin() + 1, tokens.end());

			if (cmd == "quit" || cmd == "exit")
			{
				break;
			}
			else if (cmd == "help")
			{
				printHelp();
			}
			else if (commands.find(cmd) != commands.end())
			{
				try
				{
					commands[cmd](args);
				}
				catch (const MixerControl::MixerException &e)
				{
					std::cerr << "Error (" << MixerControl::MixerException::describe(e.code()) << "): "
							  << e.what() << std::endl;
				}
				catch (const std::exception &e)
				{
					std::cerr << "Error: " << e.what() << std::endl;
				}
			}
			else
			{
				std::cout << "Unknown command: " << cmd << ". Type 'help' for available commands.\n";
			}
		}
	}
}

/**
 * @brief Command-line front end for a Behringer/Midas mixer
 */
int main(int argc, char *argv[])
{
	signal(SIGINT, signal_handler);
	signal(SIGTERM, signal_handler);

	MixerConfig config;
	std::vector<std::string> rest;
	try
	{
		config = MixerControl::MixerConfigParser::resolve(argc, argv, &rest);
	}
	catch (const MixerControl::ConfigurationException &e)
	{
		std::cerr << "Configuration error: " << e.what() << std::endl;
		printUsage();
		return 2;
	}

	bool daemon = false;
	for (const auto &arg : rest)
	{
		if (arg == "--daemon")
		{
			daemon = true;
		}
		else if (arg == "--help" || arg == "-h")
		{
			printUsage();
			return 0;
		}
		else
		{
			std::cerr << "Unknown argument: " << arg << std::endl;
			printUsage();
			return 2;
		}
	}

	MixerControl::Log::setVerbose(config.verbose);

	try
	{
		MixerClient client(config);
		client.connect();

		std::cout << "Connected to " << MixerControl::familyName(client.family()) << " mixer at "
				  << config.host << ":" << config.port << "\n";

		if (daemon)
		{
			std::cout << "Holding subscription open. Press Ctrl+C to stop.\n";
			while (!g_shutdown_requested.load())
			{
				std::this_thread::sleep_for(std::chrono::milliseconds(100));
			}
		}
		else
		{
			runConsole(client);
		}
	}
	catch (const MixerControl::MixerException &e)
	{
		std::cerr << "Error (" << MixerControl::MixerException::describe(e.code()) << "): "
				  << e.what() << std::endl;
		return 1;
	}

	std::cout << "Shutting down...\n";
	return 0;
}
