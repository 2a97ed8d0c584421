#include "ivgreeks/arrow_interop.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

#include <arrow/c/abi.h>
#include <arrow/c/bridge.h>
#include <arrow/record_batch.h>
#include <arrow/table.h>

#include "ivgreeks/compute.hpp"

namespace ivgreeks {

namespace {

constexpr const char* chain_columns[] = {"strike", "call_premium",
                                         "put_premium"};

void check_chain_schema(const arrow::Schema& schema) {
    for (const char* name : chain_columns) {
        auto field = schema.GetFieldByName(name);
        if (!field)
            throw std::runtime_error(std::string("Missing column: ") + name);
        if (field->type()->id() != arrow::Type::DOUBLE)
            throw std::runtime_error(std::string("Column is not float64: ") +
                                     name + " (" + field->type()->ToString() +
                                     ")");
    }
}

}  // namespace

std::shared_ptr<arrow::Table> import_chain(py::object obj) {
    if (!py::hasattr(obj, "__arrow_c_stream__"))
        throw std::runtime_error(
            "Option chain must implement __arrow_c_stream__ (pyarrow.Table)");

    py::object capsule = obj.attr("__arrow_c_stream__")();
    auto* c_stream =
        reinterpret_cast<ArrowArrayStream*>(PyCapsule_GetPointer(
            capsule.ptr(), "arrow_array_stream"));
    if (!c_stream) {
        throw std::runtime_error("Failed to extract ArrowArrayStream from PyCapsule");
    }

    auto reader_result = arrow::ImportRecordBatchReader(c_stream);
    if (!reader_result.ok()) {
        throw std::runtime_error("ImportRecordBatchReader failed: " +
                                 reader_result.status().ToString());
    }
    auto reader = reader_result.MoveValueUnsafe();
    check_chain_schema(*reader->schema());

    auto table_result = reader->ToTable();
    if (!table_result.ok()) {
        throw std::runtime_error("ToTable failed: " +
                                 table_result.status().ToString());
    }
    return table_result.MoveValueUnsafe();
}

py::object export_chain(const std::shared_ptr<arrow::Table>& table) {
    ChainStream c_stream = export_chain_stream(table);

    // pyarrow moves the stream out, leaving it marked released.
    py::module_ pa = py::module_::import("pyarrow");
    auto addr = reinterpret_cast<uintptr_t>(c_stream.get());
    return pa.attr("RecordBatchReader")
        .attr("_import_from_c")(addr)
        .attr("read_all")();
}

}  // namespace ivgreeks
