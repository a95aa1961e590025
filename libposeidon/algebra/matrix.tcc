#include <stdexcept>
#include <utility>

namespace libposeidon {

template<typename FieldT>
std::vector<std::vector<FieldT>> identity_matrix(const std::size_t dimension)
{
    std::vector<std::vector<FieldT>> result(
        dimension, std::vector<FieldT>(dimension, FieldT::zero()));
    for (std::size_t i = 0; i < dimension; ++i)
    {
        result[i][i] = FieldT::one();
    }
    return result;
}

template<typename FieldT>
std::vector<FieldT> matrix_vector_product(const std::vector<std::vector<FieldT>> &matrix,
                                          const std::vector<FieldT> &vector)
{
    std::vector<FieldT> result(matrix.size(), FieldT::zero());
    for (std::size_t row = 0; row < matrix.size(); ++row)
    {
        if (matrix[row].size() != vector.size())
        {
            throw std::invalid_argument("matrix and vector dimensions do not match");
        }
        for (std::size_t col = 0; col < vector.size(); ++col)
        {
            result[row] += matrix[row][col] * vector[col];
        }
    }
    return result;
}

template<typename FieldT>
std::vector<std::vector<FieldT>> matrix_product(const std::vector<std::vector<FieldT>> &left,
                                                const std::vector<std::vector<FieldT>> &right)
{
    if (right.empty())
    {
        return std::vector<std::vector<FieldT>>(left.size());
    }
    const std::size_t inner = right.size();
    const std::size_t columns = right[0].size();

    std::vector<std::vector<FieldT>> result(
        left.size(), std::vector<FieldT>(columns, FieldT::zero()));
    for (std::size_t row = 0; row < left.size(); ++row)
    {
        if (left[row].size() != inner)
        {
            throw std::invalid_argument("matrix dimensions do not match");
        }
        for (std::size_t k = 0; k < inner; ++k)
        {
            for (std::size_t col = 0; col < columns; ++col)
            {
                result[row][col] += left[row][k] * right[k][col];
            }
        }
    }
    return result;
}

template<typename FieldT>
std::vector<std::vector<FieldT>> matrix_transpose(const std::vector<std::vector<FieldT>> &matrix)
{
    if (matrix.empty())
    {
        return matrix;
    }
    const std::size_t rows = matrix.size();
    const std::size_t columns = matrix[0].size();

    std::vector<std::vector<FieldT>> result(
        columns, std::vector<FieldT>(rows, FieldT::zero()));
    for (std::size_t row = 0; row < rows; ++row)
    {
        for (std::size_t col = 0; col < columns; ++col)
        {
            result[col][row] = matrix[row][col];
        }
    }
    return result;
}

template<typename FieldT>
std::vector<std::vector<FieldT>> matrix_inverse(const std::vector<std::vector<FieldT>> &matrix)
{
    const std::size_t n = matrix.size();
    for (auto &row : matrix)
    {
        if (row.size() != n)
        {
            throw std::invalid_argument("only square matrices can be inverted");
        }
    }

    std::vector<std::vector<FieldT>> reduced(matrix);
    std::vector<std::vector<FieldT>> inverse = identity_matrix<FieldT>(n);

    for (std::size_t col = 0; col < n; ++col)
    {
        std::size_t pivot = col;
        while (pivot < n && reduced[pivot][col].is_zero())
        {
            ++pivot;
        }
        if (pivot == n)
        {
            throw std::invalid_argument("matrix is singular");
        }
        std::swap(reduced[pivot], reduced[col]);
        std::swap(inverse[pivot], inverse[col]);

        /* scale the pivot row so the pivot becomes 1 */
        const FieldT pivot_inverse = reduced[col][col].inverse();
        for (std::size_t j = 0; j < n; ++j)
        {
            reduced[col][j] *= pivot_inverse;
            inverse[col][j] *= pivot_inverse;
        }

        /* clear the column everywhere else */
        for (std::size_t row = 0; row < n; ++row)
        {
            if (row == col || reduced[row][col].is_zero())
            {
                continue;
            }
            const FieldT factor = reduced[row][col];
            for (std::size_t j = 0; j < n; ++j)
            {
                reduced[row][j] -= factor * reduced[col][j];
                inverse[row][j] -= factor * inverse[col][j];
            }
        }
    }

    return inverse;
}

template<typename FieldT>
std::size_t matrix_rank(const std::vector<std::vector<FieldT>> &matrix)
{
    std::vector<std::vector<FieldT>> reduced(matrix);
    const std::size_t rows = reduced.size();
    const std::size_t columns = rows == 0 ? 0 : reduced[0].size();

    std::size_t rank = 0;
    for (std::size_t col = 0; col < columns && rank < rows; ++col)
    {
        std::size_t pivot = rank;
        while (pivot < rows && reduced[pivot][col].is_zero())
        {
            ++pivot;
        }
        if (pivot == rows)
        {
            continue;
        }
        std::swap(reduced[pivot], reduced[rank]);

        const FieldT pivot_inverse = reduced[rank][col].inverse();
        for (std::size_t row = rank + 1; row < rows; ++row)
        {
            if (reduced[row][col].is_zero())
            {
                continue;
            }
            const FieldT factor = reduced[row][col] * pivot_inverse;
            for (std::size_t j = col; j < columns; ++j)
            {
                reduced[row][j] -= factor * reduced[rank][j];
            }
        }
        ++rank;
    }
    return rank;
}

} // libposeidon
