#include "strictenc/codec/schema.hpp"
#include "strictenc/core/log.hpp"
#include "strictenc/plan/printer.hpp"
#include "schema_reader.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
	using namespace strictenc;
	using schema_ptr = std::unique_ptr<codec::schema>;

	std::vector<std::string> split_command(const std::string& line) {
		std::vector<std::string> args;
		std::string current;
		bool in_quotes = false;
		bool escaped = false;

		for (char ch : line) {
			if (escaped) {
				current += ch;
				escaped = false;
			}
			else if (ch == '\\') {
				escaped = true;
			}
			else if (ch == '"') {
				in_quotes = !in_quotes;
			}
			else if (std::isspace(static_cast<unsigned char>(ch)) && !in_quotes) {
				if (!current.empty()) {
					args.push_back(current);
					current.clear();
				}
			}
			else {
				current += ch;
			}
		}

		if (!current.empty()) {
			args.push_back(current);
		}

		return args;
	}

	// Reads and compiles; every plan is derived before the first command runs.
	schema_ptr load_schema(const std::string& filename) {
		strictsh::schema_reader reader;
		auto specs = reader.read_file(filename);
		return std::make_unique<codec::schema>(std::move(specs));
	}

	core::byte_buffer parse_hex(const std::string& text) {
		auto bytes = core::from_hex(text);
		if (!bytes) {
			throw std::invalid_argument("malformed hex input `" + text + "`");
		}
		return std::move(*bytes);
	}

	int cmd_check(const std::string& filename) {
		try {
			auto sch = load_schema(filename);
			std::cout << filename << ": " << sch->plans().size() << " types, ok\n";
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_plan(const codec::schema& sch, const std::string& type_name) {
		try {
			if (!type_name.empty()) {
				plan::print(std::cout, sch.plan_for(type_name));
				return 0;
			}
			for (const auto& [name, p] : sch.plans()) {
				plan::print(std::cout, p);
			}
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error printing plan: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_decode(const codec::schema& sch, const std::string& type_name, const std::string& hex) {
		try {
			const auto input = parse_hex(hex);
			const auto val = sch.decode(type_name, core::byte_view(input));
			std::cout << type_name << " " << val << "\n";
			return 0;
		}
		catch (const codec::codec_error& e) {
			std::cerr << "Decode failed: " << e.what() << "\n";
			return 1;
		}
		catch (const std::exception& e) {
			std::cerr << "Error: " << e.what() << "\n";
			return 1;
		}
	}

	// Decodes and re-encodes; canonical input comes back byte for byte.
	int cmd_roundtrip(const codec::schema& sch, const std::string& type_name, const std::string& hex) {
		try {
			const auto input = parse_hex(hex);
			const auto val = sch.decode(type_name, core::byte_view(input));
			const auto output = sch.encode(type_name, val);
			std::cout << "value:  " << val << "\n";
			std::cout << "input:  " << core::to_hex(input) << "\n";
			std::cout << "output: " << core::to_hex(output) << "\n";
			if (output != input) {
				std::cout << "not canonical: skipped fields were not at their defaults\n";
				return 2;
			}
			std::cout << "identical\n";
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Roundtrip failed: " << e.what() << "\n";
			return 1;
		}
	}

	void cmd_types(const codec::schema& sch) {
		for (const auto& [name, spec] : sch.catalog()) {
			std::cout << model::to_string(spec.kind) << " " << name;
			if (spec.default_capable) {
				std::cout << " (default";
				if (spec.default_variant) {
					std::cout << " " << *spec.default_variant;
				}
				std::cout << ")";
			}
			std::cout << "\n";
		}
	}

	void cmd_help() {
		std::cout << "\nstrictsh Available Commands:\n";
		std::cout << "  types                   - List declared types\n";
		std::cout << "  check                   - Reload and compile the schema file\n";
		std::cout << "  reload                  - Same as check, keeps the new schema\n";
		std::cout << "  plan [type]             - Print derived plans\n";
		std::cout << "  decode <type> <hex>     - Decode bytes and print the value\n";
		std::cout << "  roundtrip <type> <hex>  - Decode, re-encode and compare\n";
		std::cout << "  help                    - Show this help\n";
		std::cout << "  exit/quit               - Exit shell\n\n";
	}

	void shell_mode(const std::string& filename, schema_ptr sch) {
		replxx::Replxx rx;
		rx.set_max_history_size(128);

		std::cout << "strictsh - " << filename << "\n";
		std::cout << "Type 'help' for commands, 'exit' to quit\n\n";

		while (true) {
			const char* input = rx.input("strictsh> ");
			if (!input) break;

			std::string line(input);
			if (line.empty()) continue;
			if (line == "exit" || line == "quit") break;

			std::vector<std::string> args = split_command(line);
			if (args.empty()) continue;

			const auto& cmd = args[0];

			if (cmd == "help") {
				cmd_help();
			}
			else if (cmd == "types") {
				cmd_types(*sch);
			}
			else if (cmd == "check") {
				cmd_check(filename);
			}
			else if (cmd == "reload") {
				try {
					sch = load_schema(filename);
					std::cout << "Reloaded: " << sch->plans().size() << " types\n";
				}
				catch (const std::exception& e) {
					std::cerr << "Reload failed, keeping the previous schema: " << e.what() << "\n";
				}
			}
			else if (cmd == "plan") {
				cmd_plan(*sch, args.size() > 1 ? args[1] : "");
			}
			else if (cmd == "decode") {
				if (args.size() > 2) {
					cmd_decode(*sch, args[1], args[2]);
				}
				else {
					std::cerr << "Usage: decode <type> <hex>\n";
				}
			}
			else if (cmd == "roundtrip") {
				if (args.size() > 2) {
					cmd_roundtrip(*sch, args[1], args[2]);
				}
				else {
					std::cerr << "Usage: roundtrip <type> <hex>\n";
				}
			}
			else {
				std::cerr << "Unknown command: " << cmd << " (type 'help' for available commands)\n";
			}

			rx.history_add(line);
		}
	}

	// Commands other than `check` need a compiled schema; load failures end the run.
	template <typename Fn>
	int with_schema(const std::string& filename, Fn&& fn) {
		schema_ptr sch;
		try {
			sch = load_schema(filename);
		}
		catch (const std::exception& e) {
			std::cerr << "Error loading schema: " << e.what() << "\n";
			return 1;
		}
		return fn(std::move(sch));
	}
}

int main(int argc, char* argv[]) {
	CLI::App app{ "strictsh - Strict Encoding Schema Tool" };

	std::string filename;
	bool verbose = false;
	app.add_option("schema", filename, "Schema file")->required()->check(CLI::ExistingFile);
	app.add_flag("-v,--verbose", verbose, "Log resolution and derivation decisions");

	app.require_subcommand(1);

	std::string type_name;
	std::string hex;
	int status = 0;

	app.parse_complete_callback([&]() {
		if (verbose) {
			auto& log = core::logger::instance();
			log.set_level(core::log_level::debug);
			log.add_sink(core::sinks::console_sink());
		}
		});

	auto check_cmd = app.add_subcommand("check", "Parse the schema and derive every plan");
	check_cmd->callback([&]() {
		status = cmd_check(filename);
		});

	auto plan_cmd = app.add_subcommand("plan", "Print derived plans");
	plan_cmd->add_option("type", type_name, "Type name (default: all)");
	plan_cmd->callback([&]() {
		status = with_schema(filename, [&](schema_ptr sch) {
			return cmd_plan(*sch, type_name);
			});
		});

	auto decode_cmd = app.add_subcommand("decode", "Decode hex input as a type");
	decode_cmd->add_option("type", type_name, "Type name")->required();
	decode_cmd->add_option("hex", hex, "Input bytes as hex")->required();
	decode_cmd->callback([&]() {
		status = with_schema(filename, [&](schema_ptr sch) {
			return cmd_decode(*sch, type_name, hex);
			});
		});

	auto roundtrip_cmd = app.add_subcommand("roundtrip", "Decode, re-encode and compare");
	roundtrip_cmd->add_option("type", type_name, "Type name")->required();
	roundtrip_cmd->add_option("hex", hex, "Input bytes as hex")->required();
	roundtrip_cmd->callback([&]() {
		status = with_schema(filename, [&](schema_ptr sch) {
			return cmd_roundtrip(*sch, type_name, hex);
			});
		});

	auto shell_cmd = app.add_subcommand("shell", "Interactive shell mode");
	shell_cmd->callback([&]() {
		status = with_schema(filename, [&](schema_ptr sch) {
			shell_mode(filename, std::move(sch));
			return 0;
			});
		});

	CLI11_PARSE(app, argc, argv);

	return status;
}
