#include "geoharvest/geoharvest.hpp"

#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char **argv) {
    if (argc != 4) {
        std::cerr << "usage: " << argv[0] << " EPSG:XXXX x y\n";
        return 1;
    }
    try {
        double x = std::stod(argv[2]);
        double y = std::stod(argv[3]);

        // 1) Native -> WGS84 (lon, lat)
        geoharvest::Transform transform(argv[1]);
        auto wgs = transform.forward(dp::Point{x, y, 0.0});
        std::cout << std::setprecision(10);
        std::cout << transform.source() << " (" << x << ", " << y << ") -> lon " << wgs.x << ", lat " << wgs.y
                  << (geoharvest::inWgs84Range(wgs) ? "" : "  [out of range]") << "\n";

        // 2) And back, to check the assumption round-trips
        auto back = transform.inverse(wgs);
        std::cout << "back to " << transform.source() << ": (" << back.x << ", " << back.y << ")\n";
    } catch (const std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
