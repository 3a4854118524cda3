#include "parquet_reader.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace cashalloc {

#ifdef HAVE_ARROW

TrainingDataset ParquetReader::load_training_data(const std::string& filepath) {
    // Open Parquet file
    auto infile_result = arrow::io::ReadableFile::Open(filepath, arrow::default_memory_pool());
    if (!infile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + filepath + " - " +
                                 infile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::ReadableFile> infile = *infile_result;

    std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
    auto status = parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &arrow_reader);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }

    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }

    // Single chunk per column simplifies row access
    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        throw std::runtime_error("Cannot combine Parquet chunks: " + combined.status().ToString());
    }
    table = *combined;

    // Validate schema
    const auto names = TrainingDataset::column_names();
    auto schema = table->schema();
    std::vector<std::shared_ptr<arrow::DoubleArray>> columns;
    for (const auto& name : names) {
        int idx = schema->GetFieldIndex(name);
        if (idx < 0) {
            throw std::runtime_error("Parquet file missing required column: " + name);
        }
        if (schema->field(idx)->type()->id() != arrow::Type::DOUBLE) {
            throw std::runtime_error("Parquet column " + name + " must be float64");
        }
        auto column = table->column(idx);
        if (column->num_chunks() == 0) {
            columns.push_back(nullptr);
        } else {
            columns.push_back(std::static_pointer_cast<arrow::DoubleArray>(column->chunk(0)));
        }
    }

    TrainingDataset dataset;
    int64_t num_rows = table->num_rows();
    dataset.reserve(static_cast<size_t>(num_rows));

    for (int64_t i = 0; i < num_rows; ++i) {
        TrainingSample s;
        for (size_t f = 0; f < NUM_FEATURES; ++f) {
            s.features[f] = columns[f]->Value(i);
        }
        s.reserve_pct = columns[NUM_FEATURES + 0]->Value(i);
        s.growth_pct = columns[NUM_FEATURES + 1]->Value(i);
        s.risk_pct = columns[NUM_FEATURES + 2]->Value(i);
        s.valid = columns[NUM_FEATURES + 3]->Value(i);
        s.bad_survival_probability = columns[NUM_FEATURES + 4]->Value(i);
        dataset.add(s);
    }

    return dataset;
}

#else // !HAVE_ARROW

TrainingDataset ParquetReader::load_training_data(const std::string& filepath) {
    (void)filepath;
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace cashalloc
