#include "safecalc/cli_options.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <thread>

namespace safecalc {

namespace {
bool isDigits(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (char ch : value) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

// Значение опции: следующий аргумент
const std::string& takeValue(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Не указано значение для " + args[i]);
    }
    return args[++i];
}
}

std::size_t parsePositive(const std::string& value, const std::string& optionName) {
    if (!isDigits(value)) {
        throw std::invalid_argument("Некорректное числовое значение для " + optionName + ": " + value);
    }
    std::size_t result = 0;
    try {
        result = std::stoul(value);
    }
    catch (const std::out_of_range&) {
        throw std::invalid_argument("Слишком большое значение для " + optionName + ": " + value);
    }
    if (result == 0) {
        throw std::invalid_argument("Значение " + optionName + " должно быть положительным");
    }
    return result;
}

int parsePrecision(const std::string& value) {
    if (!isDigits(value)) {
        throw std::invalid_argument("Точность должна быть неотрицательным целым: " + value);
    }
    unsigned long result = 0;
    try {
        result = std::stoul(value);
    }
    catch (const std::out_of_range&) {
        throw std::invalid_argument("Слишком большая точность: " + value);
    }
    if (result > static_cast<unsigned long>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("Слишком большая точность: " + value);
    }
    return static_cast<int>(result);
}

std::size_t defaultThreadCount() {
    std::size_t threads = std::thread::hardware_concurrency();
    return threads == 0 ? 2 : threads;
}

CliOptions parseCommandLine(const std::vector<std::string>& args) {
    CliOptions options;
    std::vector<std::string> positional;

    std::size_t i = 0;
    if (!args.empty() && args[0] == "generate") {
        options.mode = CliMode::Generate;
        i = 1;
    }

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.mode = CliMode::Help;
            return options;
        } else if (arg == "--precision" || arg == "-p") {
            options.precision = parsePrecision(takeValue(args, i));
        } else if (arg == "--file" || arg == "-f") {
            options.inputPath = takeValue(args, i);
        } else if (arg == "--output" || arg == "-o") {
            options.outputPath = takeValue(args, i);
        } else if (arg == "--threads" || arg == "-t") {
            options.threadCount = parsePositive(takeValue(args, i), arg);
        } else if (arg == "--seed") {
            const std::string& value = takeValue(args, i);
            if (!isDigits(value) || value.size() > 9) {
                throw std::invalid_argument("Некорректное значение --seed: " + value);
            }
            options.seed = static_cast<unsigned>(std::stoul(value));
        } else if (arg == "--rpn") {
            options.showPostfix = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg.size() > 1 && arg[0] == '-' && !std::isdigit(static_cast<unsigned char>(arg[1])) &&
                   arg[1] != '(' && arg[1] != '.') {
            throw std::invalid_argument("Неизвестная опция: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (options.mode == CliMode::Generate) {
        if (positional.size() != 1) {
            throw std::invalid_argument("Использование: safecalc generate <количество> [--output файл]");
        }
        options.generateCount = parsePositive(positional.front(), "generate");
        return options;
    }

    if (!options.inputPath.empty()) {
        if (!positional.empty()) {
            throw std::invalid_argument("Нельзя одновременно указывать --file и выражение");
        }
        options.mode = CliMode::Batch;
        return options;
    }

    if (!positional.empty()) {
        // Выражение может быть передано несколькими аргументами без кавычек
        options.mode = CliMode::Single;
        for (const auto& part : positional) {
            if (!options.expression.empty()) {
                options.expression.push_back(' ');
            }
            options.expression.append(part);
        }
    }
    return options;
}

std::string usageText() {
    return "Использование:\n"
           "  safecalc [опции] \"<выражение>\"        вычислить выражение\n"
           "  safecalc [опции] --file <вход.txt>      обработать файл, результат в CSV\n"
           "  safecalc generate <N> [--output файл]   сгенерировать N выражений\n"
           "  safecalc                                интерактивный режим\n"
           "\n"
           "Опции:\n"
           "  -p, --precision N   знаков после запятой (по умолчанию 2)\n"
           "  -o, --output PATH   выходной файл\n"
           "  -t, --threads N     количество потоков\n"
           "      --seed N        начальное значение генератора\n"
           "      --rpn           показать постфиксную запись\n"
           "      --debug         отладочное логирование (или SAFECALC_DEBUG=1)\n"
           "  -h, --help          эта справка\n";
}

} // namespace safecalc
