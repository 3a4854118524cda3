#ifndef CASHALLOC_PARQUET_READER_HPP
#define CASHALLOC_PARQUET_READER_HPP

#include "../model/training_data.hpp"
#include <string>

namespace cashalloc {

class ParquetReader {
public:
    /**
     * Load a training dataset from a Parquet file.
     *
     * Expected schema: float64 columns named as in
     * TrainingDataset::column_names(). Extra columns are ignored.
     *
     * @param filepath Path to Parquet file
     * @return TrainingDataset with one sample per row
     * @throws std::runtime_error if file cannot be read or schema is invalid
     */
    static TrainingDataset load_training_data(const std::string& filepath);
};

} // namespace cashalloc

#endif // CASHALLOC_PARQUET_READER_HPP
