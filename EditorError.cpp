// EditorError.cpp
#include "EditorError.hpp"

std::string Error::describe() const
{
    switch (kind)
    {
    case Kind::DialogClosed:
        return "Dialog closed";
    case Kind::IOFailed:
        if (!detail.empty())
            return "I/O error: " + code.message() + " (" + detail + ")";
        return "I/O error: " + code.message();
    }
    return "Unknown error";
}

bool operator==(const Error& a, const Error& b)
{
    return a.kind == b.kind && a.code == b.code;
}
