#ifndef FAIRVALUE_CSV_READER_HPP
#define FAIRVALUE_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace fairvalue {

// Line-oriented CSV reader.
// Fields may be wrapped in double quotes so that values such as "1,234.5"
// keep their thousands separators; a doubled quote inside a quoted field is
// a literal quote. Unquoted fields are trimmed.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

private:
    std::istream& is_;
    char delimiter_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace fairvalue

#endif // FAIRVALUE_CSV_READER_HPP
