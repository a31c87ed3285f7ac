/*
 * Copyright (c) 2026 The RCSV Authors
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#include <array>
#include <iostream>
#include <optional>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

#include <rcsv/rcsv.h>

/**
 * RCSV Example
 *
 * Demonstrates describing a record type, writing a collection to CSV text,
 * reading it back lazily, map-valued fields that become dynamic columns,
 * and the errors reported for malformed input.
 */

enum class Department : int32_t {
    Sales       = 1,
    Engineering = 2,
    Support     = 3
};

namespace rcsv {
    template<> struct EnumTraits<Department> {
        static constexpr std::array<EnumEntry<Department>, 3> members{{
            {Department::Sales,       "Sales"},
            {Department::Engineering, "Engineering"},
            {Department::Support,     "Support"}}};
    };
} // namespace rcsv

struct Employee {
    std::string             name;
    int32_t                 age = 0;
    rcsv::DateTime          hired;
    Department              department = Department::Sales;
    std::optional<double>   bonus;

    static rcsv::FieldList<Employee> describeSchema() {
        return {
            rcsv::field("Name", &Employee::name),
            rcsv::field("Age", &Employee::age),
            rcsv::field("Hired", &Employee::hired).column("HireDate"),
            rcsv::field("Department", &Employee::department),
            rcsv::field("Bonus", &Employee::bonus),
        };
    }
};

struct Monthly {
    std::string                                 product;
    rcsv::OrderedMap<std::string, int32_t>      sales;     // month -> units

    static rcsv::FieldList<Monthly> describeSchema() {
        return {
            rcsv::field("Product", &Monthly::product),
            rcsv::field("Sales", &Monthly::sales),
        };
    }
};

void writeAndReadEmployees() {
    std::cout << "=== Records ===\n\n";

    std::vector<Employee> staff = {
        {"Alice Johnson", 34, rcsv::DateTime(2019, 4, 1), Department::Engineering, 1500.0},
        {"Smith, Bob", 41, rcsv::DateTime(2012, 9, 17), Department::Sales, std::nullopt},
        {"Carol \"CJ\" Williams", 29, rcsv::DateTime(2022, 1, 10), Department::Support, 250.5},
    };

    std::string csv = rcsv::serialize(staff);
    std::cout << csv << "\n";

    // Lazy read: each record is parsed when the loop reaches it
    for (const Employee& e : rcsv::deserialize<Employee>(csv)) {
        std::cout << e.name << " (" << e.age << "), hired " << e.hired.format("yyyy-MM-dd")
                  << ", bonus " << (e.bonus ? std::to_string(*e.bonus) : std::string("none")) << "\n";
    }
    std::cout << "\n";

    // Regional formatting
    rcsv::SerializerOptions options;
    options.delimiter = ";";
    options.dateTimeFormat = "d. MMMM yyyy";
    options.culture = rcsv::Culture::byName("de-DE");
    std::cout << rcsv::serialize(staff, options) << "\n";
}

void dynamicColumns() {
    std::cout << "=== Map fields ===\n\n";

    std::vector<Monthly> report = {
        {"Widget", {{"Jan", 120}, {"Feb", 95}}},
        {"Gadget", {{"Feb", 40}, {"Mar", 77}}},
    };

    std::ostringstream os;
    rcsv::serialize(report, os);
    std::cout << os.str() << "\n";

    for (const Monthly& m : rcsv::deserialize<Monthly>(os.str())) {
        std::cout << m.product << ":";
        for (const auto& [month, units] : m.sales) {
            std::cout << " " << month << "=" << units;
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

void errorReporting() {
    std::cout << "=== Errors ===\n\n";

    try {
        rcsv::deserialize<Employee>("Name,Age\nAlice,34\n");
    } catch (const rcsv::MissingHeaderError& e) {
        std::cout << e.what() << "\n";
    }

    try {
        rcsv::deserialize<Employee>(
            "Name,Age,HireDate,Department,Bonus\n"
            "Alice,thirty,2019-04-01 00:00:00,Engineering,\n").toVector();
    } catch (const rcsv::ConversionError& e) {
        std::cout << e.what() << "\n";
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& cause) {
            std::cout << "  caused by: " << cause.what() << "\n";
        }
    }
    std::cout << "\n";
}

int main() {
    try {
        writeAndReadEmployees();
        dynamicColumns();
        errorReporting();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
