#include "Statement.hpp"
#include <sstream>

namespace tablemap {

std::vector<Row> Statement::fetchAll() {
    std::vector<Row> rows;
    while (auto row = fetch()) {
        rows.push_back(std::move(*row));
    }
    return rows;
}

std::string normalizeParameterName(const std::string& name) {
    if (!name.empty() && name[0] == ':') {
        return name.substr(1);
    }
    return name;
}

std::string formatParamDump(const std::string& sql,
                            const std::vector<BoundParameter>& params) {
    std::ostringstream out;
    out << "SQL: [" << sql.size() << "] " << sql << "\n";
    out << "Params:  " << params.size() << "\n";

    for (size_t i = 0; i < params.size(); ++i) {
        const auto& param = params[i];
        if (param.name.empty()) {
            out << "Key: Position #" << i << ":\n";
        } else {
            std::string key = ":" + param.name;
            out << "Key: Name: [" << key.size() << "] " << key << "\n";
        }
        out << "paramno=" << i << "\n";

        int type = 0;
        if (param.bound) {
            if (isInteger(param.value)) type = 1;
            else if (isText(param.value)) type = 2;
        }
        out << "param_type=" << type << "\n";
        out << "value=" << (param.bound ? valueToString(param.value) : "<unbound>") << "\n";
    }

    return out.str();
}

}  // namespace tablemap
