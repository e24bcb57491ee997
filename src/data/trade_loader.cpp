//src/data/trade_loader.cpp
#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>

#include "tax_ngin/core/logger.hpp"
#include "tax_ngin/data/conversion_utils.hpp"
#include "tax_ngin/data/trade_loader.hpp"

namespace tax_ngin {

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// A line is blank when every cell is empty or whitespace
bool is_blank_line(const std::string& line, char delimiter) {
    for (char c : line) {
        if (c != delimiter && c != '"' && !std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// Field count of one line, honouring double quotes
int count_fields(const std::string& line, char delimiter) {
    int fields = 1;
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
        } else if (c == delimiter && !quoted) {
            ++fields;
        }
    }
    return fields;
}

std::string field_at(const std::string& line, char delimiter, int column) {
    int current = 0;
    bool quoted = false;
    std::string field;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
        } else if (c == delimiter && !quoted) {
            if (current == column)
                return DataConversionUtils::trim(field);
            ++current;
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    return current == column ? DataConversionUtils::trim(field) : std::string();
}

std::string column_name(int index) {
    return "f" + std::to_string(index);
}

}  // namespace

char TradeLoader::detect_delimiter(const std::string& content) {
    auto lines = split_lines(content);
    const size_t sample = std::min<size_t>(lines.size(), 5);

    size_t tabs = 0;
    size_t commas = 0;
    for (size_t i = 0; i < sample; ++i) {
        tabs += std::count(lines[i].begin(), lines[i].end(), '\t');
        commas += std::count(lines[i].begin(), lines[i].end(), ',');
    }
    if (tabs > 0)
        return '\t';
    if (commas > 0)
        return ',';
    return ';';
}

Result<std::filesystem::path> TradeLoader::find_input_file(
    const std::filesystem::path& input_dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(input_dir, ec)) {
        return make_error<std::filesystem::path>(
            ErrorCode::FILE_NOT_FOUND, "Input directory not found: " + input_dir.string(),
            "TradeLoader");
    }

    std::vector<std::filesystem::path> csv_files;
    std::vector<std::filesystem::path> txt_files;
    for (const auto& entry : std::filesystem::directory_iterator(input_dir, ec)) {
        if (!entry.is_regular_file())
            continue;
        const auto extension = entry.path().extension().string();
        if (extension == ".csv")
            csv_files.push_back(entry.path());
        else if (extension == ".txt")
            txt_files.push_back(entry.path());
    }
    if (ec) {
        return make_error<std::filesystem::path>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to list input directory " + input_dir.string() + ": " + ec.message(),
            "TradeLoader");
    }

    // Directory order is unspecified; pick by name so runs are repeatable
    std::sort(csv_files.begin(), csv_files.end());
    std::sort(txt_files.begin(), txt_files.end());
    if (!csv_files.empty())
        return csv_files.front();
    if (!txt_files.empty())
        return txt_files.front();

    return make_error<std::filesystem::path>(
        ErrorCode::FILE_NOT_FOUND, "No .csv or .txt files found in " + input_dir.string(),
        "TradeLoader");
}

Result<LoadedLedger> TradeLoader::load_file(const std::filesystem::path& file_path) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return make_error<LoadedLedger>(ErrorCode::FILE_NOT_FOUND,
                                        "Input file not found: " + file_path.string(),
                                        "TradeLoader");
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return make_error<LoadedLedger>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to open input file: " + file_path.string(),
                                        "TradeLoader");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    INFO("Loading trades from " << file_path.string());
    return load_text(buffer.str());
}

Result<LoadedLedger> TradeLoader::load_text(const std::string& raw_content) {
    std::string content = raw_content;
    if (content.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
        content.erase(0, kUtf8Bom.size());
    }

    LoadedLedger ledger;
    ledger.delimiter = detect_delimiter(content);
    const char delimiter = ledger.delimiter;
    DEBUG("Detected delimiter: " << (delimiter == '\t' ? std::string("\\t")
                                                      : std::string(1, delimiter)));

    // Header plus every data line up to the first blank one
    auto lines = split_lines(content);
    if (lines.empty()) {
        return make_error<LoadedLedger>(ErrorCode::INVALID_DATA, "Input is empty", "TradeLoader");
    }
    std::vector<std::string> data_lines;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (is_blank_line(lines[i], delimiter)) {
            DEBUG("Stopped reading at blank line (row " << i << ")");
            break;
        }
        data_lines.push_back(lines[i]);
    }
    ledger.rows_read = data_lines.size();
    if (data_lines.empty()) {
        WARN("Input has a header but no trade rows");
        return ledger;
    }

    // Rows may omit trailing empty fields; pad them to the widest row
    std::vector<int> field_counts;
    field_counts.reserve(data_lines.size());
    int num_columns = 0;
    for (const auto& line : data_lines) {
        field_counts.push_back(count_fields(line, delimiter));
        num_columns = std::max(num_columns, field_counts.back());
    }
    if (num_columns <= ENTRY_DATE_COLUMN) {
        return make_error<LoadedLedger>(
            ErrorCode::INVALID_DATA,
            "Expected at least " + std::to_string(ENTRY_DATE_COLUMN + 1) +
                " columns, widest row has " + std::to_string(num_columns),
            "TradeLoader");
    }

    // Data rows too short to carry an entry date, keyed by 1-based data row
    std::map<int64_t, int> short_rows;
    std::string csv_text = lines.front() + "\n";
    for (size_t i = 0; i < data_lines.size(); ++i) {
        const int fields = field_counts[i];
        if (fields <= ENTRY_DATE_COLUMN) {
            short_rows[static_cast<int64_t>(i) + 1] = fields;
        }
        const std::string padding(static_cast<size_t>(num_columns - fields), delimiter);
        csv_text += data_lines[i] + padding + "\n";
    }

    // Rows Arrow rejects for a wrong column count, keyed by 1-based data row
    std::map<int64_t, std::string> invalid_rows;
    int64_t unnumbered_invalid = 0;

    auto read_options = arrow::csv::ReadOptions::Defaults();
    read_options.use_threads = false;
    read_options.skip_rows = 1;
    read_options.autogenerate_column_names = true;

    auto parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.delimiter = delimiter;
    parse_options.ignore_empty_lines = true;
    parse_options.invalid_row_handler = [&](const arrow::csv::InvalidRow& row) {
        const std::string text(row.text);
        if (row.number > 0) {
            invalid_rows[row.number - 1] = text;
        } else {
            ++unnumbered_invalid;
            invalid_rows[-unnumbered_invalid] = text;
        }
        ledger.rejected.push_back(
            {row.number > 0 ? static_cast<size_t>(row.number - 1) : 0,
             field_at(text, delimiter, STOCK_NAME_COLUMN),
             "Expected " + std::to_string(row.expected_columns) + " columns, found " +
                 std::to_string(row.actual_columns)});
        return arrow::csv::InvalidRowResult::Skip;
    };

    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    for (int i = 0; i < num_columns; ++i) {
        convert_options.column_types[column_name(i)] = arrow::utf8();
    }

    std::shared_ptr<arrow::Table> table;
    try {
        auto input = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(csv_text));
        auto maybe_reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), input,
                                                          read_options, parse_options,
                                                          convert_options);
        if (!maybe_reader.ok()) {
            return make_error<LoadedLedger>(ErrorCode::INVALID_DATA,
                                            "Failed to create CSV reader: " +
                                                maybe_reader.status().ToString(),
                                            "TradeLoader");
        }
        auto maybe_table = (*maybe_reader)->Read();
        if (!maybe_table.ok()) {
            return make_error<LoadedLedger>(ErrorCode::INVALID_DATA,
                                            "Failed to parse CSV: " +
                                                maybe_table.status().ToString(),
                                            "TradeLoader");
        }
        auto maybe_combined = (*maybe_table)->CombineChunks();
        if (!maybe_combined.ok()) {
            return make_error<LoadedLedger>(ErrorCode::INVALID_DATA,
                                            "Failed to combine CSV chunks: " +
                                                maybe_combined.status().ToString(),
                                            "TradeLoader");
        }
        table = *maybe_combined;
    } catch (const std::exception& e) {
        return make_error<LoadedLedger>(ErrorCode::INVALID_DATA,
                                        std::string("Error reading CSV: ") + e.what(),
                                        "TradeLoader");
    }

    for (const auto& rejected : ledger.rejected) {
        WARN("Rejected row " << rejected.row << " (" << rejected.stock_name
                             << "): " << rejected.reason);
    }

    if (table->num_rows() == 0) {
        return ledger;
    }

    std::vector<std::shared_ptr<arrow::Array>> columns;
    for (int i = 0; i < table->num_columns(); ++i) {
        columns.push_back(table->column(i)->chunk(0));
    }

    auto cell = [&](int column, int64_t index) -> Result<std::string> {
        if (column >= static_cast<int>(columns.size())) {
            return std::string();
        }
        return DataConversionUtils::extract_string(columns[column], index);
    };

    // Arrow drops invalid rows, so walk the data rows alongside the table
    int64_t source_row = 0;
    auto reject = [&](size_t row, const std::string& stock, const std::string& reason) {
        WARN("Rejected row " << row << " (" << stock << "): " << reason);
        ledger.rejected.push_back({row, stock, reason});
    };

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        do {
            ++source_row;
        } while (invalid_rows.count(source_row) > 0);
        const size_t row = unnumbered_invalid > 0 ? 0 : static_cast<size_t>(source_row);

        auto short_row = short_rows.find(source_row);
        if (short_row != short_rows.end()) {
            auto stock = cell(STOCK_NAME_COLUMN, i);
            reject(row, stock.is_ok() ? stock.value() : "",
                   "Expected at least " + std::to_string(ENTRY_DATE_COLUMN + 1) +
                       " columns, found " + std::to_string(short_row->second));
            continue;
        }

        auto stock = cell(STOCK_NAME_COLUMN, i);
        auto entry_price_text = cell(ENTRY_PRICE_COLUMN, i);
        auto exit_price_text = cell(EXIT_PRICE_COLUMN, i);
        auto entry_date_text = cell(ENTRY_DATE_COLUMN, i);
        auto exit_date_text = cell(EXIT_DATE_COLUMN, i);
        if (stock.is_error() || entry_price_text.is_error() || exit_price_text.is_error() ||
            entry_date_text.is_error() || exit_date_text.is_error()) {
            reject(row, stock.is_ok() ? stock.value() : "", "Unreadable row");
            continue;
        }

        const std::string& stock_name = stock.value();
        if (stock_name.empty() || entry_price_text.value().empty() ||
            entry_date_text.value().empty()) {
            reject(row, stock_name, "Missing stock name, entry price or entry date");
            continue;
        }

        TradeRecord record;
        record.id = static_cast<uint64_t>(source_row);
        record.source_row = row;
        record.stock_name = stock_name;

        auto entry_price = DataConversionUtils::parse_price(entry_price_text.value());
        if (entry_price.is_error()) {
            reject(row, stock_name, entry_price.error()->what());
            continue;
        }
        record.entry_price = entry_price.value();

        auto entry_date = DataConversionUtils::parse_date(entry_date_text.value());
        if (entry_date.is_error()) {
            reject(row, stock_name, entry_date.error()->what());
            continue;
        }
        record.entry_date = entry_date.value();

        if (!exit_price_text.value().empty()) {
            auto exit_price = DataConversionUtils::parse_price(exit_price_text.value());
            if (exit_price.is_error()) {
                reject(row, stock_name, exit_price.error()->what());
                continue;
            }
            record.exit_price = exit_price.value();
        }

        if (!exit_date_text.value().empty()) {
            auto exit_date = DataConversionUtils::parse_date(exit_date_text.value());
            if (exit_date.is_error()) {
                reject(row, stock_name, exit_date.error()->what());
                continue;
            }
            record.exit_date = exit_date.value();
        }

        TRACE("Row " << row << ": " << record.stock_name << " entry=" << record.entry_price
                     << " on " << record.entry_date);
        ledger.trades.push_back(std::move(record));
    }

    INFO("Loaded " << ledger.trades.size() << " trades from " << ledger.rows_read
                   << " rows, rejected " << ledger.rejected.size());
    return ledger;
}

}  // namespace tax_ngin
