#include <queryable.hpp>

#include <iostream>
#include <string>
#include <vector>

int main()
{
    std::vector<std::string> words{"pull", "based", "lazy", "sequences"};

    std::string lengths = qry::from(words)
                              .map([](const std::string& w) {
                                  return w.size();
                              })
                              .join("+");

    QRY_CHECK_EQ(lengths, "4+5+4+9");

    auto odd_squares = qry::range(1, 20)
                           .filter([](int i) {
                               return i % 2 != 0;
                           })
                           .map([](int i) {
                               return i * i;
                           });

    const qry::Optional<int> first = odd_squares.next();
    QRY_CHECK_EQ(first, 1);

    // Terminals resume from the cursor: 9, 25, 49, 81, ...
    //
    const qry::isize index = odd_squares.find_index([](int sq) {
        return sq > 50;
    });
    QRY_CHECK_EQ(index, 3);

    const qry::Optional<int> rest = odd_squares.reduce([](int acc, int sq) {
        return acc + sq;
    });
    QRY_CHECK_EQ(rest, 121 + 169 + 225 + 289 + 361);

    QRY_CHECK(qry::of(1.5, 2.5).concat(std::vector<double>{3.5}).includes(3.5));

    std::cout << qry::range(10, 0, -1).slice(-3).reverse().push(0).join(", ") << std::endl;

    return 0;
}
