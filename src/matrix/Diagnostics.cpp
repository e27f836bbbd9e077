#include "matrix/Diagnostics.hpp"

namespace wordspace {

size_t count_hapax_legomena(const CountMatrix& term_document) {
    size_t n = 0;
    for (double s : term_document.row_sums()) {
        if (s == 1.0) ++n;
    }
    return n;
}

}  // namespace wordspace
