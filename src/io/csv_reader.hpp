#ifndef CASHALLOC_CSV_READER_HPP
#define CASHALLOC_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace cashalloc {

// Line-oriented CSV reader. Cells are whitespace-trimmed; quoting is not supported.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based number of the last line returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    static std::string trim(const std::string& s);
};

} // namespace cashalloc

#endif // CASHALLOC_CSV_READER_HPP
