#pragma once

#include <memory>

#include <arrow/api.h>
#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace ivgreeks {

// Import an option chain from a Python object supporting the PyCapsule
// (__arrow_c_stream__) protocol. The schema must carry float64 columns
// strike, call_premium and put_premium.
std::shared_ptr<arrow::Table> import_chain(py::object obj);

// Export a priced chain back to Python as a pyarrow.Table via PyCapsule.
py::object export_chain(const std::shared_ptr<arrow::Table>& table);

}  // namespace ivgreeks
