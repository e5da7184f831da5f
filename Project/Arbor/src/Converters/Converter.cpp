#include "pch.h"
#include "Converters/Converter.hpp"

namespace Arbor
{
    void SingleValueConverter::Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext&) const
    {
        writer.SetValue(ToString(value));
    }

    Instance SingleValueConverter::Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const
    {
        try
        {
            return FromString(context.RequiredType(), reader.GetValue());
        }
        catch (ConversionError& e)
        {
            e.Add("type", context.RequiredType()->ToString());
            throw;
        }
    }
}
