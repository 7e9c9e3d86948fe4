#include "dropcatch/physics_types.hpp"

namespace dropcatch
{

const char* ToString(BodyRole role)
{
    switch (role)
    {
        case BodyRole::Bucket:
            return "bucket";
        case BodyRole::Droplet:
            return "droplet";
        case BodyRole::Wall:
            return "wall";
        case BodyRole::Ground:
            return "ground";
    }
    return "unknown";
}

} // namespace dropcatch
