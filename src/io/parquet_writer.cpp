#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace cashalloc {

#ifdef HAVE_ARROW

namespace {

double column_value(const TrainingSample& s, size_t column) {
    if (column < NUM_FEATURES) {
        return s.features[column];
    }
    switch (column - NUM_FEATURES) {
        case 0: return s.reserve_pct;
        case 1: return s.growth_pct;
        case 2: return s.risk_pct;
        case 3: return s.valid;
        default: return s.bad_survival_probability;
    }
}

} // anonymous namespace

void ParquetWriter::write_training_data(const TrainingDataset& dataset, const std::string& filepath) {
    const auto names = TrainingDataset::column_names();

    // Build Arrow schema
    arrow::FieldVector fields;
    for (const auto& name : names) {
        fields.push_back(arrow::field(name, arrow::float64()));
    }
    auto schema = arrow::schema(fields);

    // One builder per column
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    for (size_t c = 0; c < names.size(); ++c) {
        arrow::DoubleBuilder builder;
        auto status = builder.Reserve(static_cast<int64_t>(dataset.size()));
        if (!status.ok()) {
            throw std::runtime_error("Failed to reserve memory for " + names[c] + " column: " + status.ToString());
        }
        for (const auto& sample : dataset.samples()) {
            status = builder.Append(column_value(sample, c));
            if (!status.ok()) {
                throw std::runtime_error("Failed to append " + names[c] + ": " + status.ToString());
            }
        }

        std::shared_ptr<arrow::Array> array;
        status = builder.Finish(&array);
        if (!status.ok()) {
            throw std::runtime_error("Failed to finish " + names[c] + " array: " + status.ToString());
        }
        arrays.push_back(array);
    }

    auto table = arrow::Table::Make(schema, arrays);

    // Open output file
    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    auto status = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024);
    if (!status.ok()) {
        throw std::runtime_error("Failed to write Parquet table: " + status.ToString());
    }

    status = outfile->Close();
    if (!status.ok()) {
        throw std::runtime_error("Failed to close Parquet file: " + status.ToString());
    }
}

#else // !HAVE_ARROW

void ParquetWriter::write_training_data(const TrainingDataset& /* dataset */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace cashalloc
