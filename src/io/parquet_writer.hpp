#ifndef CASHALLOC_PARQUET_WRITER_HPP
#define CASHALLOC_PARQUET_WRITER_HPP

#include "../model/training_data.hpp"
#include <string>

namespace cashalloc {

class ParquetWriter {
public:
    /**
     * Write a training dataset to a Parquet file.
     *
     * Output schema: one float64 column per entry of
     * TrainingDataset::column_names(), in that order.
     *
     * @param dataset Samples to write (may be empty)
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if file cannot be written or Arrow is unavailable
     */
    static void write_training_data(const TrainingDataset& dataset, const std::string& filepath);
};

} // namespace cashalloc

#endif // CASHALLOC_PARQUET_WRITER_HPP
