namespace libposeidon {

template<typename FieldT>
FieldT power(const FieldT &base, const std::size_t exponent)
{
    FieldT result = FieldT::one();

    bool found_one = false;

    for (long i = 8 * sizeof(exponent) - 1; i >= 0; --i)
    {
        if (found_one)
        {
            result = result.squared();
        }

        if (exponent & (1ull << i))
        {
            found_one = true;
            result *= base;
        }
    }

    return result;
}

template<typename FieldT>
FieldT sbox_power(const FieldT &x, const std::size_t alpha)
{
    if (alpha == 5)
    {
        /* x^2, x^4, x^5 */
        FieldT intermediate = x.squared();
        intermediate = intermediate.squared();
        return intermediate * x;
    }
    else if (alpha == 3)
    {
        FieldT intermediate = x.squared();
        return intermediate * x;
    }
    else if (alpha == 7)
    {
        /* x^2, x^4, x^6, x^7 */
        const FieldT x2 = x.squared();
        FieldT intermediate = x2.squared();
        intermediate *= x2;
        return intermediate * x;
    }
    else if (alpha == 17)
    {
        /* x^2 */
        FieldT intermediate = x.squared();
        /* x^4 */
        intermediate = intermediate.squared();
        /* x^8 */
        intermediate = intermediate.squared();
        /* x^16 */
        intermediate = intermediate.squared();
        /* x^17 */
        return intermediate * x;
    }

    return libposeidon::power(x, alpha);
}

} // libposeidon
