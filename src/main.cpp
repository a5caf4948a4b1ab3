#include "ris.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <argparse.hpp>

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("risconv", "0.1.0", argparse::default_arguments::all);

    program.add_argument("filename")
        .help("The citation file to read")
        .required();

    program.add_argument("-o", "--output")
        .help("Write the result to this file instead of stdout")
        .default_value(std::string(""));

    program.add_argument("-d", "--dialect")
        .help("Input and output dialect: ris, wok or medline")
        .default_value(std::string("ris"));

    program.add_argument("--encoding")
        .help("Source encoding: utf-8 or latin-1")
        .default_value(std::string("utf-8"));

    program.add_argument("--emit-records")
        .help("Print the parsed records instead of re-serialized text")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--no-unknown")
        .help("Drop tags that have no field name")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--relaxed-lists")
        .help("Turn repeated single-value tags into lists instead of keeping the first value")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--lenient")
        .help("Skip lines without a tag instead of failing")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--strict-end")
        .help("Fail when the input ends inside a record")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string filename = program.get<std::string>("filename");
    std::string output = program.get<std::string>("--output");

    try {
        ris::ParserOptions parseOptions;
        parseOptions.dialect = ris::dialectFromName(program.get<std::string>("--dialect"));
        parseOptions.skipUnknownTags = program.get<bool>("--no-unknown");
        parseOptions.enforceListTags = !program.get<bool>("--relaxed-lists");
        parseOptions.skipMissingTags = program.get<bool>("--lenient");
        if (program.get<bool>("--strict-end"))
            parseOptions.missingEnd = ris::MissingEndPolicy::ERROR;

        auto records = ris::load(filename, program.get<std::string>("--encoding"), parseOptions);

        std::ofstream outfile;
        if (!output.empty()) {
            outfile.open(output, std::ios::binary);
            if (!outfile.is_open())
                throw std::runtime_error("Could not open file: " + output);
        }
        std::ostream& out = output.empty() ? std::cout : outfile;

        if (program.get<bool>("--emit-records")) {
            for (const auto& record : records) {
                out << record << "\n";
            }
        } else {
            ris::WriterOptions writeOptions;
            writeOptions.dialect = parseOptions.dialect;
            writeOptions.skipUnknownTags = parseOptions.skipUnknownTags;
            writeOptions.enforceListTags = parseOptions.enforceListTags;
            ris::dump(records, out, writeOptions);
        }

        if (!output.empty())
            std::cout << "Converted " << records.size() << " records to " << output << "\n";

    } catch (const ris::ParseError& e) {
        std::cerr << "Parse error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
