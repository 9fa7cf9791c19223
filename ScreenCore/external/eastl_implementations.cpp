/*
 * Contains implementations of things that EASTL expects the user to provide
 */

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>

void* operator new[](size_t size, const char* name, int flags, unsigned debugFlags, const char* file, int line) {
    return new uint8_t[size];
}

void* operator new[](
    size_t size, size_t alignment, size_t offset, const char* pName, int flags, unsigned debugFlags, const char* file,
    int line
) {
    return new uint8_t[size];
}

int Vsnprintf8(char* pDestination, size_t n, const char* pFormat, va_list arguments) {
    return vsnprintf(pDestination, n, pFormat, arguments);
}

int Vsnprintf16(char16_t* pDestination, size_t n, const char16_t* pFormat, va_list arguments) {
    return 0;
}

int Vsnprintf32(char32_t* pDestination, size_t n, const char32_t* pFormat, va_list arguments) {
    return 0;
}
